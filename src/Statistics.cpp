// Statistics.cpp – Group-by counts over extracted situations and the
// console / HTML reports built from them.

#include "DATEX2Parser/Statistics.hpp"
#include "DATEX2Parser/Document.hpp"
#include "DATEX2Parser/Labels.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace datex2 {

// ─── Grouping helpers ─────────────────────────────────────────────────────────

namespace {

struct Group {
    size_t                total{0};
    std::set<std::string> distinct; // values of the secondary column
};

using GroupList = std::vector<std::pair<std::string, Group>>;

std::string orUnspecified(const std::optional<std::string>& v) {
    return v ? *v : std::string(kUnspecified);
}

// Groups by key(s), collecting distinct sub(s) per group. The result is in
// key order, then stably sorted by descending total.
template <typename KeyFn, typename SubFn>
GroupList groupBy(const std::vector<Situation>& sits, KeyFn key, SubFn sub) {
    std::map<std::string, Group> groups;
    for (const Situation& s : sits) {
        Group& g = groups[key(s)];
        ++g.total;
        g.distinct.insert(sub(s));
    }

    GroupList out(groups.begin(), groups.end());
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.second.total > b.second.total;
    });
    return out;
}

template <typename KeyFn>
size_t countDistinct(const std::vector<Situation>& sits, KeyFn key) {
    std::set<std::string> values;
    for (const Situation& s : sits)
        values.insert(key(s));
    return values.size();
}

double percentOf(size_t part, size_t whole) {
    if (whole == 0)
        return 0.0;
    // Ties round to even: 6.25 -> 6.2, 93.75 -> 93.8
    double pct = static_cast<double>(part) / static_cast<double>(whole) * 100.0;
    return std::nearbyint(pct * 10.0) / 10.0;
}

std::string none(const Situation&) { return {}; }

std::string provinceOf(const Situation& s)     { return orUnspecified(s.province); }
std::string municipalityOf(const Situation& s) { return orUnspecified(s.municipality); }
std::string communityOf(const Situation& s)    { return orUnspecified(s.autonomous_community); }
std::string severityOf(const Situation& s)     { return orUnspecified(s.severity); }
std::string managementOf(const Situation& s)   { return orUnspecified(s.management_type); }

} // namespace

// ─── Aggregations ─────────────────────────────────────────────────────────────

Statistics::Statistics(std::vector<Situation> situations)
    : situations_(std::move(situations)) {}

Summary Statistics::summary() const {
    Summary s;
    s.total          = situations_.size();
    s.provinces      = countDistinct(situations_, provinceOf);
    s.communities    = countDistinct(situations_, communityOf);
    s.municipalities = countDistinct(situations_, municipalityOf);
    return s;
}

std::vector<ProvinceRow> Statistics::byProvince() const {
    std::vector<ProvinceRow> rows;
    for (auto& [key, g] : groupBy(situations_, provinceOf, municipalityOf))
        rows.push_back({key, g.total, g.distinct.size()});
    return rows;
}

std::vector<SeverityRow> Statistics::bySeverity() const {
    std::vector<SeverityRow> rows;
    for (auto& [key, g] : groupBy(situations_, severityOf, none))
        rows.push_back({key, g.total, percentOf(g.total, situations_.size())});
    return rows;
}

std::vector<CommunityRow> Statistics::byAutonomousCommunity() const {
    std::vector<CommunityRow> rows;
    for (auto& [key, g] : groupBy(situations_, communityOf, provinceOf))
        rows.push_back({key, g.total, g.distinct.size()});
    return rows;
}

std::vector<ManagementRow> Statistics::byManagementType() const {
    std::vector<ManagementRow> rows;
    for (auto& [key, g] : groupBy(situations_, managementOf, none))
        rows.push_back({key, managementLabel(key), g.total,
                        percentOf(g.total, situations_.size())});
    return rows;
}

// ─── Console report ───────────────────────────────────────────────────────────

void Statistics::printReport(std::ostream& os) const {
    const std::string rule(60, '=');
    const Summary sum = summary();

    os << '\n' << rule << '\n'
       << "REPORTE DE INCIDENCIAS DE TRÁFICO - BALIZAS V16\n"
       << rule << '\n';

    os << "\nRESUMEN GENERAL\n"
       << "   - Total de incidencias: " << sum.total << '\n'
       << "   - Provincias afectadas: " << sum.provinces << '\n'
       << "   - CCAA afectadas: " << sum.communities << '\n'
       << "   - Municipios afectados: " << sum.municipalities << '\n';

    const std::ios::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(1);

    os << "\nDISTRIBUCIÓN POR SEVERIDAD\n";
    for (const SeverityRow& r : bySeverity())
        os << "   - " << severityLabel(r.severity) << ": " << r.total
           << " (" << r.percent << "%)\n";

    os << "\nTOP 10 PROVINCIAS CON MÁS INCIDENCIAS\n";
    std::vector<ProvinceRow> provinces = byProvince();
    for (size_t i = 0; i < provinces.size() && i < 10; ++i) {
        const ProvinceRow& r = provinces[i];
        os << "   " << std::setw(2) << (i + 1) << ". " << r.province << ": "
           << r.total << " incidencias (" << r.municipalities << " municipios)\n";
    }

    os << "\nTIPO DE INCIDENCIA\n";
    for (const ManagementRow& r : byManagementType())
        os << "   - " << r.label << ": " << r.total << " (" << r.percent << "%)\n";

    os << '\n' << rule << '\n';
    os.flags(flags);
    os.precision(precision);
}

// ─── HTML report ──────────────────────────────────────────────────────────────

static constexpr const char* kReportHead = R"(<!DOCTYPE html>
<html lang="es">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Estadísticas Balizas V16</title>
<style>
body { font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif; margin: 0; padding: 20px;
       background: linear-gradient(135deg, #1a1a2e 0%, #16213e 100%); min-height: 100vh; color: #fff; }
.container { max-width: 1200px; margin: 0 auto; }
h1 { text-align: center; color: #00d4ff; margin-bottom: 30px; }
.summary-grid { display: grid; grid-template-columns: repeat(auto-fit, minmax(200px, 1fr)); gap: 20px; margin-bottom: 40px; }
.summary-card { background: rgba(255, 255, 255, 0.1); border-radius: 15px; padding: 25px; text-align: center;
                border: 1px solid rgba(255, 255, 255, 0.2); }
.summary-card .number { font-size: 3em; font-weight: bold; color: #00d4ff; margin-bottom: 10px; }
.summary-card .label { color: #aaa; font-size: 0.9em; text-transform: uppercase; }
.section { background: rgba(255, 255, 255, 0.05); border-radius: 15px; padding: 25px; margin-bottom: 25px;
           border: 1px solid rgba(255, 255, 255, 0.1); }
.section h2 { color: #00d4ff; margin-top: 0; border-bottom: 2px solid rgba(0, 212, 255, 0.3); padding-bottom: 10px; }
table { width: 100%; border-collapse: collapse; }
th, td { padding: 12px 15px; text-align: left; border-bottom: 1px solid rgba(255, 255, 255, 0.1); }
th { background: rgba(0, 212, 255, 0.2); color: #00d4ff; font-weight: 600; }
.severity-low { color: #28a745; }
.severity-medium { color: #ffc107; }
.severity-high { color: #fd7e14; }
.severity-highest { color: #dc3545; }
</style>
</head>
<body>
<div class="container">
<h1>Estadísticas de Incidencias - Balizas V16</h1>
)";

static void summaryCard(std::ostream& os, size_t number, const char* label) {
    os << "<div class=\"summary-card\"><div class=\"number\">" << number
       << "</div><div class=\"label\">" << label << "</div></div>\n";
}

std::string Statistics::htmlReport() const {
    const Summary sum = summary();
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);

    os << kReportHead;

    os << "<div class=\"summary-grid\">\n";
    summaryCard(os, sum.total,          "Total Incidencias");
    summaryCard(os, sum.provinces,      "Provincias Afectadas");
    summaryCard(os, sum.communities,    "CCAA Afectadas");
    summaryCard(os, sum.municipalities, "Municipios Afectados");
    os << "</div>\n";

    os << "<div class=\"section\">\n<h2>Incidencias por Provincia</h2>\n<table>\n"
       << "<thead><tr><th>#</th><th>Provincia</th><th>Total Incidencias</th>"
          "<th>Municipios Afectados</th></tr></thead>\n<tbody>\n";
    std::vector<ProvinceRow> provinces = byProvince();
    for (size_t i = 0; i < provinces.size() && i < 15; ++i) {
        const ProvinceRow& r = provinces[i];
        os << "<tr><td>" << (i + 1) << "</td><td>" << htmlEscape(r.province) << "</td><td>"
           << r.total << "</td><td>" << r.municipalities << "</td></tr>\n";
    }
    os << "</tbody>\n</table>\n</div>\n";

    os << "<div class=\"section\">\n<h2>Distribución por Severidad</h2>\n<table>\n"
       << "<thead><tr><th>Severidad</th><th>Total</th><th>Porcentaje</th></tr></thead>\n<tbody>\n";
    for (const SeverityRow& r : bySeverity()) {
        os << "<tr><td class=\"severity-" << htmlEscape(r.severity) << "\">"
           << htmlEscape(severityLabel(r.severity)) << "</td><td>" << r.total << "</td><td>"
           << r.percent << "%</td></tr>\n";
    }
    os << "</tbody>\n</table>\n</div>\n";

    os << "<div class=\"section\">\n<h2>Incidencias por Comunidad Autónoma</h2>\n<table>\n"
       << "<thead><tr><th>Comunidad Autónoma</th><th>Total Incidencias</th>"
          "<th>Provincias Afectadas</th></tr></thead>\n<tbody>\n";
    for (const CommunityRow& r : byAutonomousCommunity()) {
        os << "<tr><td>" << htmlEscape(r.community) << "</td><td>" << r.total << "</td><td>"
           << r.provinces << "</td></tr>\n";
    }
    os << "</tbody>\n</table>\n</div>\n";

    os << "</div>\n</body>\n</html>\n";
    return os.str();
}

void Statistics::writeHtmlReport(const std::filesystem::path& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out)
        throw WriteError("Cannot open '" + path.string() + "' for writing");
    out << htmlReport();
    if (!out)
        throw WriteError("Error writing '" + path.string() + "'");
}

} // namespace datex2
