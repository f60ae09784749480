#include "CsvExporter.hpp"
#include "Cpp20Utils.hpp"
#include <format>
#include <sstream>

namespace CsvExporter {

std::string escapeField(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string formatRow(const Trade& t) {
    const std::string& market = t.title.empty() ? t.market_slug : t.title;
    const double shares = t.shares_normalized != 0.0 ? t.shares_normalized : t.shares;
    return std::format("{},{},{},{},{},{:.4f},{:.2f},{:.2f}",
        Cpp20Utils::formatUnixTimestamp(t.timestamp),
        escapeField(market),
        escapeField(t.user),
        ::toString(t.side),
        escapeField(t.token_label),
        t.price,
        shares,
        t.notional());
}

void write(std::ostream& out, const std::vector<Trade>& trades) {
    out << kHeader << "\r\n";
    for (const auto& t : trades) {
        out << formatRow(t) << "\r\n";
    }
}

std::string toString(const std::vector<Trade>& trades) {
    std::ostringstream ss;
    write(ss, trades);
    return ss.str();
}

} // namespace CsvExporter
