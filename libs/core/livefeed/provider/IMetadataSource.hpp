#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct MetadataRequest {
    std::vector<std::string> conditionIds;
    std::vector<std::string> eventSlugs;
};

// One record of the metadata collaborator's answer; any key may be empty.
struct MarketMetadata {
    std::string slug;
    std::string conditionId;
    std::string marketSlug;
    std::string eventSlug;
    std::optional<std::string> image;
};

struct MetadataResponse {
    bool ok = false;
    std::vector<MarketMetadata> markets;
    std::string error;
};

class IMetadataSource {
public:
    using Completion = std::function<void(MetadataResponse)>;
    virtual ~IMetadataSource() = default;

    // Completion may run on any thread of the io_context.
    virtual void fetch(MetadataRequest request, Completion done) = 0;
};
