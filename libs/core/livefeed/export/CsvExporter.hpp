#pragma once
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include "../model/TradeData.h"

// Materialised view → CSV (RFC 4180 quoting, ISO-8601 UTC timestamps).
namespace CsvExporter {

inline constexpr const char* kHeader = "timestamp,market,wallet,side,token,price,shares,volume";

// Quotes the field when it contains a comma, quote, CR or LF; inner quotes are doubled.
std::string escapeField(std::string_view field);

std::string formatRow(const Trade& trade);

void write(std::ostream& out, const std::vector<Trade>& trades);

std::string toString(const std::vector<Trade>& trades);

} // namespace CsvExporter
