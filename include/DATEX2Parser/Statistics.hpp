#pragma once
// Statistics.hpp – Aggregates extracted situations by province, severity,
// autonomous community and management type.
//
// Missing text fields are grouped under kUnspecified ("Sin especificar"),
// which also counts as one distinct value in the summary.
// Row lists are sorted by total (descending), ties by key (ascending).

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace datex2 {

struct Summary {
    size_t total{0};
    size_t provinces{0};
    size_t communities{0};
    size_t municipalities{0};
};

struct ProvinceRow {
    std::string province;
    size_t      total{0};
    size_t      municipalities{0}; // distinct municipalities in this province
};

struct SeverityRow {
    std::string severity;
    size_t      total{0};
    double      percent{0.0};      // share of all rows, one decimal
};

struct CommunityRow {
    std::string community;
    size_t      total{0};
    size_t      provinces{0};      // distinct provinces in this community
};

struct ManagementRow {
    std::string type;              // raw enumeration value
    std::string label;             // display name
    size_t      total{0};
    double      percent{0.0};
};

class Statistics {
public:
    explicit Statistics(std::vector<Situation> situations);

    [[nodiscard]] Summary summary() const;

    [[nodiscard]] std::vector<ProvinceRow>   byProvince() const;
    [[nodiscard]] std::vector<SeverityRow>   bySeverity() const;
    [[nodiscard]] std::vector<CommunityRow>  byAutonomousCommunity() const;
    [[nodiscard]] std::vector<ManagementRow> byManagementType() const;

    // Plain-text report: summary, severity, top 10 provinces, management type.
    void printReport(std::ostream& os) const;

    // Standalone HTML page: summary cards, top 15 provinces, severity and
    // community tables.
    [[nodiscard]] std::string htmlReport() const;

    // Write htmlReport() to `path`. Throws WriteError on I/O failure.
    void writeHtmlReport(const std::filesystem::path& path) const;

    [[nodiscard]] const std::vector<Situation>& situations() const { return situations_; }

private:
    std::vector<Situation> situations_;
};

} // namespace datex2
