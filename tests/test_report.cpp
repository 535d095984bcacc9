// test_report.cpp – Statistics aggregation, console / HTML reports and map
// rendering over hand-built situations.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_report

#include "DATEX2Parser/Document.hpp"
#include "DATEX2Parser/Labels.hpp"
#include "DATEX2Parser/MapWriter.hpp"
#include "DATEX2Parser/Statistics.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
using namespace datex2;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

static bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

// ─── Fixture ─────────────────────────────────────────────────────────────────

static Situation make(const char* id, std::optional<std::string> severity,
                      std::optional<std::string> province,
                      std::optional<std::string> municipality,
                      std::optional<std::string> community,
                      std::optional<std::string> management) {
    Situation s;
    s.id                   = id;
    s.severity             = std::move(severity);
    s.latitude             = 40.0;
    s.longitude            = -3.0;
    s.province             = std::move(province);
    s.municipality         = std::move(municipality);
    s.autonomous_community = std::move(community);
    s.management_type      = std::move(management);
    return s;
}

//  Madrid ×3 (2 municipalities), Valencia ×2, Sevilla ×1, one with no
//  administrative data at all.
static std::vector<Situation> fixture() {
    return {
        make("1", "high",   "Madrid",   "Madrid",    "Comunidad de Madrid", "laneClosures"),
        make("2", "high",   "Madrid",   "Getafe",    "Comunidad de Madrid", "laneClosures"),
        make("3", "low",    "Madrid",   "Getafe",    "Comunidad de Madrid", "roadClosed"),
        make("4", "medium", "Valencia", "Gandia",    "Comunitat Valenciana", "laneClosures"),
        make("5", "high",   "Valencia", "Valencia",  "Comunitat Valenciana", "weird"),
        make("6", std::nullopt, "Sevilla", "Sevilla", "Andalucía", std::nullopt),
        make("7", "high",   std::nullopt, std::nullopt, std::nullopt, "other"),
    };
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: summary and group-by tables
// ─────────────────────────────────────────────────────────────────────────────
static void testAggregations() {
    std::cout << "\n=== Test: aggregations ===\n";
    Statistics stats(fixture());

    Summary sum = stats.summary();
    CHECK(sum.total == 7,          "total == 7");
    CHECK(sum.provinces == 4,      "4 provinces incl. Sin especificar");
    CHECK(sum.communities == 4,    "4 communities incl. Sin especificar");
    CHECK(sum.municipalities == 6, "6 municipalities incl. Sin especificar");

    auto prov = stats.byProvince();
    CHECK(prov.size() == 4, "4 province rows");
    if (prov.size() == 4) {
        CHECK(prov[0].province == "Madrid" && prov[0].total == 3, "Madrid first with 3");
        CHECK(prov[0].municipalities == 2,                        "Madrid has 2 municipalities");
        CHECK(prov[1].province == "Valencia" && prov[1].total == 2, "Valencia second with 2");
        // Ties on 1: key order, "Sevilla" < "Sin especificar"
        CHECK(prov[2].province == "Sevilla",                      "tie broken by key (Sevilla)");
        CHECK(prov[3].province == std::string(kUnspecified),      "tie broken by key (Sin especificar)");
    }

    auto sev = stats.bySeverity();
    CHECK(sev.size() == 4, "4 severity rows");
    if (sev.size() == 4) {
        CHECK(sev[0].severity == "high" && sev[0].total == 4, "high first with 4");
        CHECK(sev[0].percent == 57.1,                         "high is 57.1%");
        CHECK(sev[1].percent == 14.3,                         "single row is 14.3%");
    }

    auto ccaa = stats.byAutonomousCommunity();
    CHECK(!ccaa.empty() && ccaa[0].community == "Comunidad de Madrid", "Madrid community first");
    if (!ccaa.empty())
        CHECK(ccaa[0].provinces == 1, "one province in Comunidad de Madrid");

    auto mgmt = stats.byManagementType();
    CHECK(mgmt.size() == 5, "5 management rows");
    if (!mgmt.empty()) {
        CHECK(mgmt[0].type == "laneClosures" && mgmt[0].total == 3, "laneClosures first with 3");
        CHECK(mgmt[0].label == "Cierre de carril",                  "laneClosures label");
        CHECK(mgmt[0].percent == 42.9,                              "laneClosures is 42.9%");
    }
    bool weird_verbatim = false;
    for (const ManagementRow& r : mgmt)
        if (r.type == "weird" && r.label == "weird") weird_verbatim = true;
    CHECK(weird_verbatim, "unknown management type labelled verbatim");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: empty input
// ─────────────────────────────────────────────────────────────────────────────
static void testEmpty() {
    std::cout << "\n=== Test: empty statistics ===\n";
    Statistics stats(std::vector<Situation>{});
    CHECK(stats.summary().total == 0,     "total == 0");
    CHECK(stats.summary().provinces == 0, "no provinces");
    CHECK(stats.byProvince().empty(),     "no province rows");
    CHECK(stats.bySeverity().empty(),     "no severity rows");

    std::ostringstream os;
    stats.printReport(os);
    CHECK(contains(os.str(), "Total de incidencias: 0"), "report prints zero total");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: console report
// ─────────────────────────────────────────────────────────────────────────────
static void testConsoleReport() {
    std::cout << "\n=== Test: console report ===\n";
    Statistics stats(fixture());
    std::ostringstream os;
    os << 1.23456;            // default formatting before
    stats.printReport(os);
    os << ' ' << 1.23456;     // and after
    std::string text = os.str();

    CHECK(contains(text, "Total de incidencias: 7"),               "summary total");
    CHECK(contains(text, "Alta: 4 (57.1%)"),                       "severity line with label");
    CHECK(contains(text, " 1. Madrid: 3 incidencias (2 municipios)"), "top province line");
    CHECK(contains(text, "Cierre de carril: 3 (42.9%)"),           "management line");
    CHECK(text.rfind("1.23456") == text.size() - 7,                "stream formatting restored");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: HTML report escapes payload text
// ─────────────────────────────────────────────────────────────────────────────
static void testHtmlReport() {
    std::cout << "\n=== Test: HTML report ===\n";
    auto sits = fixture();
    sits.push_back(make("8", "low", "<b>Evil & Co</b>", "x", "y", std::nullopt));
    Statistics stats(std::move(sits));
    std::string html = stats.htmlReport();

    CHECK(contains(html, "<!DOCTYPE html>"),                         "doctype present");
    CHECK(contains(html, "Total Incidencias"),                       "summary card");
    CHECK(contains(html, "&lt;b&gt;Evil &amp; Co&lt;/b&gt;"),        "province escaped");
    CHECK(!contains(html, "<b>Evil"),                                "no raw markup");
    CHECK(contains(html, "Comunidad de Madrid"),                     "community table");

    fs::path out = fs::temp_directory_path() / "datex2_test_report.html";
    try {
        stats.writeHtmlReport(out);
        std::ifstream in(out);
        std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        CHECK(written == html, "written file matches htmlReport()");
        fs::remove(out);
    } catch (const std::exception& e) {
        std::cerr << "FAIL write report: " << e.what() << '\n';
        ++failures;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: map rendering
// ─────────────────────────────────────────────────────────────────────────────
static void testMap() {
    std::cout << "\n=== Test: map rendering ===\n";
    Situation s = make("S\"1", "highest", "Madrid", "Madrid", "Comunidad de Madrid", "roadClosed");
    s.road_name  = "A-6 </script>";
    s.cause_type = "roadMaintenance";
    s.km_point   = 23.5;
    s.latitude   = 40.4;
    s.longitude  = -3.9;

    std::string popup = popupHtml(s);
    CHECK(contains(popup, "A-6 &lt;/script&gt;"),       "road name escaped in popup");
    CHECK(contains(popup, "Muy Alta"),                   "severity label");
    CHECK(contains(popup, "darkred"),                    "severity colour");
    CHECK(contains(popup, "Carretera cerrada"),          "management label");
    CHECK(contains(popup, "Mantenimiento de vía"),       "cause label");
    CHECK(contains(popup, "23.5"),                       "km point shown");
    CHECK(contains(popup, "S&quot;1"),                   "id escaped");

    Situation bare;
    bare.latitude = 1.0;
    bare.longitude = 2.0;
    std::string bare_popup = popupHtml(bare);
    CHECK(contains(bare_popup, "Carretera sin nombre"),  "missing road placeholder");
    CHECK(contains(bare_popup, "No especificada"),       "missing severity placeholder");
    CHECK(contains(bare_popup, "N/A, N/A"),              "missing location placeholder");

    Situation odd = bare;
    odd.severity = "extreme";
    std::string odd_popup = popupHtml(odd);
    CHECK(contains(odd_popup, "color: blue; font-weight: bold;\">N/A</span>"),
          "severity without a display name shows N/A");
    CHECK(!contains(odd_popup, "extreme"),               "raw severity not shown in popup");

    MapOptions opts;
    opts.legend = false;
    std::string page = renderMap({s, bare}, opts);
    CHECK(contains(page, "L.map('map').setView([40.4168, -3.7038], 6)"), "map centred on Spain");
    CHECK(contains(page, "[40.4, -3.9, \"darkred\""),
          "first marker coordinates");
    CHECK(contains(page, "[1, 2, \"blue\""),             "second marker blue");
    CHECK(!contains(page, "</script>\""),                "payload cannot close the script");
    CHECK(!contains(page, "class=\"legend\">"),          "legend omitted when disabled");
    CHECK(contains(renderMap({s}), "class=\"legend\">"), "legend present by default");

    std::string clustered = renderMap({s, bare});
    CHECK(contains(clustered, "leaflet.markercluster@1.5.3/dist/leaflet.markercluster.js"),
          "cluster plugin script loaded");
    CHECK(contains(clustered, "MarkerCluster.Default.css"),     "cluster plugin styles loaded");
    CHECK(contains(clustered, "var markers = L.markerClusterGroup().addTo(map);"),
          "markers clustered by default");

    MapOptions flat;
    flat.clustering = false;
    std::string unclustered = renderMap({s, bare}, flat);
    CHECK(contains(unclustered, "var markers = L.layerGroup().addTo(map);"),
          "plain layer group when clustering is off");
    CHECK(!contains(unclustered, "markercluster"),              "no cluster plugin when off");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 6: label helpers
// ─────────────────────────────────────────────────────────────────────────────
static void testLabels() {
    std::cout << "\n=== Test: labels ===\n";
    CHECK(severityLabel("low") == "Baja",                  "low → Baja");
    CHECK(severityLabel("highest") == "Muy Alta",          "highest → Muy Alta");
    CHECK(severityLabel("unknown") == "unknown",           "unknown verbatim");
    CHECK(managementLabel("singleAlternateLineTraffic") == "Tráfico alterno", "alternate traffic");
    CHECK(causeLabel("roadOrCarriagewayOrLaneManagement") == "Gestión de tráfico", "cause label");
    CHECK(severityColor(std::nullopt) == "blue",           "absent → blue");
    CHECK(severityColor(std::string("medium")) == "orange", "medium → orange");
    CHECK(htmlEscape("a<b>&\"'") == "a&lt;b&gt;&amp;&quot;&#39;", "html escape");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 7: percentages round half to even
// ─────────────────────────────────────────────────────────────────────────────
static void testPercentRounding() {
    std::cout << "\n=== Test: percent rounding ===\n";
    // 1/16 = 6.25 % and 15/16 = 93.75 %, both exact halves
    std::vector<Situation> sits;
    sits.push_back(make("0", "low", "Madrid", "Madrid", "Comunidad de Madrid", "other"));
    for (int i = 1; i < 16; ++i)
        sits.push_back(make("x", "high", "Madrid", "Madrid", "Comunidad de Madrid", "other"));

    Statistics stats(std::move(sits));
    auto sev = stats.bySeverity();
    CHECK(sev.size() == 2, "2 severity rows");
    if (sev.size() == 2) {
        CHECK(sev[0].severity == "high" && sev[0].percent == 93.8, "15/16 rounds to 93.8");
        CHECK(sev[1].severity == "low" && sev[1].percent == 6.2,   "1/16 rounds to 6.2");
    }
    auto mgmt = stats.byManagementType();
    CHECK(mgmt.size() == 1 && mgmt[0].percent == 100.0, "single management row is 100%");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 8: unwritable output paths
// ─────────────────────────────────────────────────────────────────────────────
static void testWriteErrors() {
    std::cout << "\n=== Test: write errors ===\n";
    fs::path missing = fs::temp_directory_path() / "datex2_no_such_dir" / "sub";
    fs::remove_all(missing.parent_path());

    Statistics stats(fixture());
    bool report_thrown = false;
    try {
        stats.writeHtmlReport(missing / "report.html");
    } catch (const WriteError&) {
        report_thrown = true;
    }
    CHECK(report_thrown, "writeHtmlReport throws WriteError");

    bool map_thrown = false;
    try {
        writeMap(fixture(), missing / "map.html");
    } catch (const Datex2Error&) {
        map_thrown = true;
    }
    CHECK(map_thrown, "writeMap throws a Datex2Error");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testAggregations();
    testEmpty();
    testConsoleReport();
    testHtmlReport();
    testMap();
    testLabels();
    testPercentRounding();
    testWriteErrors();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
