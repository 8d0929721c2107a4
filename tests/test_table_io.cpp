#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <sstream>
#include "table_io.hpp"
#include "utils.h"

namespace {

std::string readAll(FILE* fp) {
    std::string out;
    rewind(fp);
    char buf[256];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) out.append(buf, n);
    return out;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

SweepRow makeRow(int32_t r, OptValue units, OptValue score, uint64_t n1, uint64_t n4, uint64_t n8) {
    SweepRow row;
    row.radius = r;
    row.radiusUnits = units;
    row.result.score = score;
    row.result.nObserved = n1;
    row.result.nGe4 = n4;
    row.result.nEq8 = n8;
    return row;
}

class TableIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger::Logger::getInstance().setLevel(logger::LogLevel::ERROR);
    }
};

} // namespace

TEST_F(TableIoTest, MissingTokens) {
    for (const char* tok : {"", "NA", "nan", "NaN", "n/a", "<NA>", "null", "None"}) {
        EXPECT_TRUE(isMissingToken(tok)) << tok;
    }
    EXPECT_FALSE(isMissingToken("0"));
    EXPECT_FALSE(isMissingToken("nano"));
}

TEST_F(TableIoTest, ReadCommaSeparated) {
    std::istringstream in(
        "x [px],y [px],u [px/frame],v [px/frame]\n"
        "0,0,-0.1,-0.1\r\n"
        "1,0,0,2\n"
        "\n"
        "0,1,NA,\n");
    SampleTable t = readSampleTable(in);
    ASSERT_EQ(t.nCols(), 4u);
    ASSERT_EQ(t.nRows(), 3u);
    EXPECT_EQ(t.names()[2], "u [px/frame]");
    EXPECT_DOUBLE_EQ(*t.column("v [px/frame]")[1], 2.0);
    EXPECT_DOUBLE_EQ(*t.column("v [px/frame]")[0], -0.1);
    EXPECT_FALSE(t.column("u [px/frame]")[2].has_value());
    EXPECT_FALSE(t.column("v [px/frame]")[2].has_value());
}

TEST_F(TableIoTest, ReadSkipsLeadingLinesAndDetectsTabs) {
    std::istringstream in(
        "# exported by the PIV tool\n"
        "# frame 12\n"
        "x\ty\tu\tv\tquality\n"
        "1.5\t2\t0.25\t-0.5\tgood\n");
    SampleTable t = readSampleTable(in, 2);
    ASSERT_EQ(t.nCols(), 5u);
    ASSERT_EQ(t.nRows(), 1u);
    EXPECT_DOUBLE_EQ(*t.column("x")[0], 1.5);
    EXPECT_DOUBLE_EQ(*t.column("v")[0], -0.5);
    EXPECT_FALSE(t.column("quality")[0].has_value());
}

TEST_F(TableIoTest, ReadQuotedFields) {
    std::istringstream in(
        "\"x, px\",\"y, px\",u,v\n"
        "\"3\",4,\"1e-2\",5\n");
    SampleTable t = readSampleTable(in);
    EXPECT_TRUE(t.hasColumn("x, px"));
    EXPECT_DOUBLE_EQ(*t.column("x, px")[0], 3.0);
    EXPECT_DOUBLE_EQ(*t.column("u")[0], 0.01);
}

TEST_F(TableIoTest, ReadNonFiniteAsMissing) {
    std::istringstream in(
        "x,y,u,v\n"
        "0,0,inf,1\n"
        "1,0,0.5,-INF\n"
        "2,0,1e999,0.25\n"
        "3,0,0.5,0.25\n");
    SampleTable t = readSampleTable(in);
    ASSERT_EQ(t.nRows(), 4u);
    EXPECT_FALSE(t.column("u")[0].has_value());
    EXPECT_DOUBLE_EQ(*t.column("v")[0], 1.0);
    EXPECT_FALSE(t.column("v")[1].has_value());
    EXPECT_FALSE(t.column("u")[2].has_value());
    EXPECT_DOUBLE_EQ(*t.column("u")[3], 0.5);
}

TEST_F(TableIoTest, ReadExplicitDelimiter) {
    std::istringstream in("x;y;u;v\n1;2;3;4\n");
    SampleTable t = readSampleTable(in, 0, ';');
    EXPECT_EQ(t.nCols(), 4u);
    EXPECT_DOUBLE_EQ(*t.column("v")[0], 4.0);
}

TEST_F(TableIoTest, ReadFieldCountMismatch) {
    std::istringstream in("x,y,u,v\n1,2,3,4\n1,2,3\n");
    EXPECT_THROW(readSampleTable(in), SchemaError);
}

TEST_F(TableIoTest, ReadDuplicateHeader) {
    std::istringstream in("x,y,x,v\n1,2,3,4\n");
    EXPECT_THROW(readSampleTable(in), SchemaError);
}

TEST_F(TableIoTest, ReadPastEnd) {
    std::istringstream in("x,y,u,v\n");
    EXPECT_THROW(readSampleTable(in, 3), SchemaError);
    std::istringstream empty("");
    EXPECT_THROW(readSampleTable(empty), SchemaError);
}

TEST_F(TableIoTest, ReadTsvFile) {
    const std::string path = ::testing::TempDir() + "velcorr_table_test.tsv";
    {
        std::ofstream out(path);
        out << "x,1\ty\tu\tv\n0\t0\t1\t1\n";
    }
    SampleTable t = readSampleTable(path);
    EXPECT_TRUE(t.hasColumn("x,1"));
    EXPECT_EQ(t.nRows(), 1u);
    std::remove(path.c_str());
}

TEST_F(TableIoTest, WriteSweepTable) {
    std::vector<SweepRow> rows = {
        makeRow(1, 0.5, 0.25, 100, 96, 64),
        makeRow(2, 1.0, std::nullopt, 0, 0, 0)};
    FILE* fp = tmpfile();
    ASSERT_NE(fp, nullptr);
    writeSweepTable(fp, rows);
    std::vector<std::string> out = lines(readAll(fp));
    fclose(fp);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0], "radius,radius_units,corr,n_observed,n_ge4,n_eq8");
    EXPECT_EQ(out[1], "1,0.5,0.25,100,96,64");
    EXPECT_EQ(out[2], "2,1,NaN,0,0,0");
}

TEST_F(TableIoTest, WriteSweepTableDirectional) {
    SweepRow row = makeRow(3, std::nullopt, 0.5, 9, 4, 1);
    row.result.directional = {0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, std::nullopt};
    FILE* fp = tmpfile();
    ASSERT_NE(fp, nullptr);
    writeSweepTable(fp, {row}, '\t', true);
    std::vector<std::string> out = lines(readAll(fp));
    fclose(fp);
    ASSERT_EQ(out.size(), 2u);
    std::vector<std::string> header, values;
    split(header, out[0], '\t');
    split(values, out[1], '\t');
    ASSERT_EQ(header.size(), 14u);
    ASSERT_EQ(values.size(), 14u);
    EXPECT_EQ(header[6], "corr_d0");
    EXPECT_EQ(values[1], "NaN");
    EXPECT_EQ(values[12], "0.5");
    EXPECT_EQ(values[13], "NaN");
}

TEST_F(TableIoTest, SweepJson) {
    SweepOutput out;
    out.conversionFactor = 0.65;
    out.factorInferred = true;
    out.height = 6;
    out.width = 8;
    out.nSamples = 48;
    out.nObserved = 47;
    out.rows = {makeRow(1, 0.65, 0.75, 47, 40, 30), makeRow(2, 1.3, std::nullopt, 0, 0, 0)};
    SweepConfig config;
    config.directional = true;
    nlohmann::json js = sweepToJson(out, config);
    EXPECT_DOUBLE_EQ(js["conversion_factor"].get<double>(), 0.65);
    EXPECT_TRUE(js["conversion_factor_inferred"].get<bool>());
    EXPECT_EQ(js["grid"]["width"].get<int32_t>(), 8);
    EXPECT_EQ(js["n_observed_cells"].get<size_t>(), 47u);
    ASSERT_EQ(js["results"].size(), 2u);
    EXPECT_DOUBLE_EQ(js["results"][0]["corr"].get<double>(), 0.75);
    EXPECT_EQ(js["results"][0]["n_ge4"].get<uint64_t>(), 40u);
    EXPECT_TRUE(js["results"][1]["corr"].is_null());
    EXPECT_EQ(js["results"][0]["directional"].size(), 8u);
    EXPECT_EQ(js["config"]["max_radius"].get<int32_t>(), 25);
}

TEST_F(TableIoTest, WriteFieldTable) {
    const std::string path = ::testing::TempDir() + "velcorr_field_test.csv";
    VectorField f(2, 2);
    f.set(0, 1, 1.5, -2);
    writeFieldTable(path, f);
    std::ifstream in(path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::vector<std::string> out = lines(text);
    ASSERT_EQ(out.size(), 5u);
    EXPECT_EQ(out[0], "x,y,u,v");
    EXPECT_EQ(out[1], "0,0,NaN,NaN");
    EXPECT_EQ(out[2], "1,0,1.5,-2");
    std::remove(path.c_str());
}
