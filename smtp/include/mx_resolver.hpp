#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mailcore::smtp {

struct MXRecord {
    std::string hostname;
    int priority;

    bool operator<(const MXRecord& other) const {
        return priority < other.priority;
    }
};

class MxResolver {
public:
    virtual ~MxResolver() = default;

    // Hosts to try for the domain, most preferred first. Never empty: without
    // MX records the domain itself is the host.
    virtual std::vector<std::string> resolve(const std::string& domain) = 0;
};

// libresolv lookup against the system resolver.
class DnsMxResolver : public MxResolver {
public:
    std::vector<std::string> resolve(const std::string& domain) override;

    static std::vector<MXRecord> lookup_mx(const std::string& domain);

    // Parses a DNS response. `length` is what the resolver reported and may
    // exceed `capacity` when the answer did not fit.
    static std::vector<MXRecord> parse_answer(const unsigned char* answer, size_t capacity, int length);
};

}  // namespace mailcore::smtp
