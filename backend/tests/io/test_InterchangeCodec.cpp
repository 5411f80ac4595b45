#include <gtest/gtest.h>

#include <clocale>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "io/InterchangeCodec.h"
#include "store/PointStore.h"
#include "helpers/TestLogging.h"

using namespace lidarmap::backend;
using lidarmap::backend::common::Point;

namespace {

std::string readAll(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void writeAll(const std::string& path, const std::string& text) {
    std::ofstream f(path, std::ios::trunc);
    f << text;
}

std::vector<Point> samplePoints() {
    return {
        Point(1000.0, 0.0, 15, 1000.0),
        Point(0.1 + 0.2, -2500.125, 47, 2500.125),
        Point(-1234.5678901234, 987.6543210987, 3, 1580.0),
    };
}

io::ExportMetadata sampleMeta() {
    io::ExportMetadata m;
    m.scan_count = 42;
    m.timestamp = "2024-05-01T13:45:02.123";
    m.total_points = 3;
    m.filter_distance = 8000.0;
    return m;
}

io::InterchangeCodec makeCodec() { return io::InterchangeCodec(tests::testLogger("Test.Codec")); }

} // namespace

TEST(InterchangeFormat, DetectsByExtensionIgnoringCase) {
    EXPECT_EQ(io::formatFromPath("scan.json"), io::InterchangeFormat::Structured);
    EXPECT_EQ(io::formatFromPath("dir/Scan.JSON"), io::InterchangeFormat::Structured);
    EXPECT_EQ(io::formatFromPath("scan.Csv"), io::InterchangeFormat::Tabular);
    EXPECT_EQ(io::formatFromPath("scan.txt"), io::InterchangeFormat::Unknown);
    EXPECT_EQ(io::formatFromPath("scan"), io::InterchangeFormat::Unknown);
    EXPECT_EQ(io::formatFromPath("dir.json/scan"), io::InterchangeFormat::Unknown);
}

TEST(InterchangeCodecStructured, RoundTripIsExact) {
    const auto points = samplePoints();
    const std::string text = io::serializeStructured(points, sampleMeta());
    std::vector<Point> back;
    auto res = io::parseStructured(text, back);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(back, points);
    EXPECT_EQ(res.points_read, 3u);
    EXPECT_EQ(res.meta.scan_count, 42u);
    EXPECT_EQ(res.meta.timestamp, "2024-05-01T13:45:02.123");
    EXPECT_EQ(res.meta.total_points, 3u);
    EXPECT_DOUBLE_EQ(res.meta.filter_distance, 8000.0);
}

TEST(InterchangeCodecStructured, RoundTripIsExactUnderCommaDecimalLocale) {
    const std::string saved = std::setlocale(LC_ALL, nullptr);
    const char* commaLocales[] = {"de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8", "fr_FR.utf8", "ru_RU.UTF-8"};
    bool switched = false;
    for (const char* name : commaLocales) {
        if (std::setlocale(LC_ALL, name)) { switched = true; break; }
    }
    if (!switched) GTEST_SKIP() << "no comma-decimal locale installed";

    const auto points = samplePoints();
    std::vector<Point> fromJson;
    std::vector<Point> fromCsv;
    auto json = io::parseStructured(io::serializeStructured(points, sampleMeta()), fromJson);
    auto csv = io::parseTabular(io::serializeTabular(points), fromCsv);
    std::setlocale(LC_ALL, saved.c_str());

    ASSERT_TRUE(json.ok) << json.error;
    ASSERT_TRUE(csv.ok) << csv.error;
    EXPECT_EQ(fromJson, points);
    EXPECT_EQ(fromCsv, points);
    EXPECT_DOUBLE_EQ(json.meta.filter_distance, 8000.0);
}

TEST(InterchangeCodecStructured, EmptyCloudSerializesAndParses) {
    const std::string text = io::serializeStructured({}, sampleMeta());
    std::vector<Point> back;
    auto res = io::parseStructured(text, back);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_TRUE(back.empty());
}

TEST(InterchangeCodecStructured, SkipsUnknownKeysAndAcceptsNulls) {
    const std::string text = R"({
        "format_version": 2,
        "device": {"model": "A1", "tags": ["x", {"nested": [1, 2, null]}], "ok": true},
        "points": [[1, 2, 3, 4], [5, 6, 7, 8]],
        "scan_count": null,
        "timestamp": null
    })";
    std::vector<Point> back;
    auto res = io::parseStructured(text, back);
    ASSERT_TRUE(res.ok) << res.error;
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[1], Point(5, 6, 7, 8));
    EXPECT_EQ(res.meta.scan_count, 0u);
    EXPECT_TRUE(res.meta.timestamp.empty());
}

TEST(InterchangeCodecStructured, NumericTimestampIsKept) {
    std::vector<Point> back;
    auto res = io::parseStructured(R"({"points": [], "timestamp": 1714567502.5})", back);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(res.meta.timestamp, "1714567502.500");
}

TEST(InterchangeCodecStructured, ShortPointsAreCompleted) {
    std::vector<Point> back;
    auto res = io::parseStructured(R"({"points": [[3000, 4000], [0, -200, 9]]})", back);
    ASSERT_TRUE(res.ok) << res.error;
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[0].quality, io::kImportedQuality);
    EXPECT_DOUBLE_EQ(back[0].distance_mm, 5000.0);
    EXPECT_EQ(back[1].quality, 9u);
    EXPECT_DOUBLE_EQ(back[1].distance_mm, 200.0);
}

TEST(InterchangeCodecStructured, MalformedDocumentsLeaveOutputUntouched) {
    const char* bad[] = {
        "",
        "[]",
        R"({"scan_count": 3})",
        R"({"points": [[1, 2], [3]]})",
        R"({"points": [[1, 2, 3, 4, 5]]})",
        R"({"points": [[1, "two"]]})",
        R"({"points": [[1, 2, -3]]})",
        R"({"points": [[1, 2]] )",
        R"({"points": [[1, 2]]} trailing)",
        R"({"points": [[1, 2]], "scan_count": "many"})",
    };
    for (const char* text : bad) {
        std::vector<Point> out{Point(9, 9, 9, 9)};
        auto res = io::parseStructured(text, out);
        EXPECT_FALSE(res.ok) << "accepted: " << text;
        EXPECT_FALSE(res.error.empty()) << text;
        ASSERT_EQ(out.size(), 1u) << text;
    }
}

TEST(InterchangeCodecTabular, HeaderAndRoundTrip) {
    const auto points = samplePoints();
    const std::string text = io::serializeTabular(points);
    EXPECT_EQ(text.substr(0, text.find('\n')), "X,Y,Quality,Distance");
    std::vector<Point> back;
    auto res = io::parseTabular(text, back);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(back, points);
}

TEST(InterchangeCodecTabular, PartialColumnsAreCompleted) {
    std::vector<Point> back;
    auto res = io::parseTabular("x, y\n3000, 4000\n\n-600,800\n", back);
    ASSERT_TRUE(res.ok) << res.error;
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[0], Point(3000, 4000, io::kImportedQuality, 5000));
    EXPECT_EQ(back[1], Point(-600, 800, io::kImportedQuality, 1000));

    back.clear();
    res = io::parseTabular("X,Y,Quality\n1,0,12\n", back);
    ASSERT_TRUE(res.ok) << res.error;
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].quality, 12u);
}

TEST(InterchangeCodecTabular, ScanCountIsEstimatedFromPointCount) {
    std::string text = "X,Y\n";
    for (int i = 0; i < 250; ++i) text += std::to_string(i) + ",1\n";
    std::vector<Point> back;
    auto res = io::parseTabular(text, back);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(res.meta.scan_count, 2u);
    EXPECT_EQ(res.meta.total_points, 250u);
}

TEST(InterchangeCodecTabular, ErrorsNameTheLine) {
    std::vector<Point> out;
    auto res = io::parseTabular("X,Y,Quality,Distance\n1,2,3,4\n1,2,x,4\n", out);
    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.error.find("line 3"), std::string::npos) << res.error;
    EXPECT_TRUE(out.empty());

    res = io::parseTabular("X,Y\n1,2,3\n", out);
    EXPECT_FALSE(res.ok);
    EXPECT_NE(res.error.find("line 2"), std::string::npos) << res.error;

    res = io::parseTabular("A,B\n1,2\n", out);
    EXPECT_FALSE(res.ok);

    res = io::parseTabular("\n\n", out);
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(out.empty());
}

TEST(InterchangeCodecFiles, ImportReplacesStoreContents) {
    auto codec = makeCodec();
    const std::string path = "logs/test/codec_import.csv";
    ASSERT_TRUE(codec.exportFile(path, samplePoints(), sampleMeta()));

    store::PointStore pointStore(10);
    pointStore.insert(Point(7, 7, 7, 7));
    auto res = codec.importFile(path, pointStore);
    ASSERT_TRUE(res.ok) << res.error;
    auto snap = pointStore.snapshot();
    EXPECT_EQ(*snap, samplePoints());
    std::remove(path.c_str());
}

TEST(InterchangeCodecFiles, ImportKeepsNewestWhenFileExceedsCapacity) {
    auto codec = makeCodec();
    const std::string path = "logs/test/codec_capacity.json";
    std::vector<Point> many;
    for (int i = 0; i < 8; ++i) many.emplace_back(i, 0, 10, i);
    ASSERT_TRUE(codec.exportFile(path, many, sampleMeta()));

    store::PointStore pointStore(5);
    auto res = codec.importFile(path, pointStore);
    ASSERT_TRUE(res.ok) << res.error;
    EXPECT_EQ(res.points_read, 8u);
    auto snap = pointStore.snapshot();
    ASSERT_EQ(snap->size(), 5u);
    EXPECT_DOUBLE_EQ(snap->front().x_mm, 3.0);
    EXPECT_DOUBLE_EQ(snap->back().x_mm, 7.0);
    std::remove(path.c_str());
}

TEST(InterchangeCodecFiles, FailedImportLeavesStoreUntouched) {
    auto codec = makeCodec();
    const std::string path = "logs/test/codec_broken.json";
    writeAll(path, R"({"points": [[1, 2, 3, 4], [oops]]})");

    store::PointStore pointStore(10);
    pointStore.insert(Point(7, 7, 7, 7));
    auto res = codec.importFile(path, pointStore);
    EXPECT_FALSE(res.ok);
    ASSERT_EQ(pointStore.size(), 1u);
    EXPECT_EQ(pointStore.at(0), Point(7, 7, 7, 7));

    res = codec.importFile("logs/test/no_such_file.json", pointStore);
    EXPECT_FALSE(res.ok);
    res = codec.importFile("logs/test/cloud.xyz", pointStore);
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(pointStore.size(), 1u);
    std::remove(path.c_str());
}

TEST(InterchangeCodecFiles, ExportRejectsUnknownExtension) {
    auto codec = makeCodec();
    EXPECT_FALSE(codec.exportFile("logs/test/cloud.xyz", samplePoints(), sampleMeta()));
}

TEST(InterchangeCodecFiles, ReportListsMetricsAndPoints) {
    auto codec = makeCodec();
    const std::string path = "logs/test/codec_report.txt";
    processing::RoomMetrics m;
    m.width = 6000.0;
    m.height = 4000.0;
    m.area_m2 = 24.0;
    m.perimeter = 20000.0;
    processing::SessionStats stats;
    stats.scans_processed = 17;
    std::vector<Point> pts{Point(1500.04, -20.0, 10, 1500.2)};

    ASSERT_TRUE(codec.writeReport(path, m, stats, pts));
    const std::string text = readAll(path);
    EXPECT_EQ(text.rfind("Room Scan Data - ", 0), 0u);
    EXPECT_NE(text.find(std::string(50, '=')), std::string::npos);
    EXPECT_NE(text.find("Room Width: 6.000 m\n"), std::string::npos);
    EXPECT_NE(text.find("Room Height: 4.000 m\n"), std::string::npos);
    EXPECT_NE(text.find("Room Area: 24.000 m"), std::string::npos);
    EXPECT_NE(text.find("Room Perimeter: 20.000 m\n"), std::string::npos);
    EXPECT_NE(text.find("Total Points: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Total Scans: 17\n"), std::string::npos);
    EXPECT_NE(text.find("Point Data (x, y in mm):\n1500.0, -20.0\n"), std::string::npos);

    ASSERT_TRUE(codec.writeReport(path, std::nullopt, stats, {}));
    EXPECT_NE(readAll(path).find("Room metrics unavailable"), std::string::npos);
    std::remove(path.c_str());
}
