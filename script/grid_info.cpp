#include "velcorr.h"
#include "radiussweep.hpp"
#include "sweepconfig.hpp"
#include "table_io.hpp"
#include <algorithm>

int32_t cmdGridInfo(int32_t argc, char** argv) {
    std::string inFile, outField, configFile;
    std::string xcol, ycol, ucol, vcol;
    std::string delimStr = "auto";
    int32_t dataStartRow = 0;
    double pxConversion = -1;
    int32_t gridStep = -1;
    int32_t debug_ = 0;

    ParamList pl;
    pl.add_option("in", "Input table (.csv, or .tsv for tab-delimited)", inFile, true)
      .add_option("config", "JSON configuration file; command line options take precedence", configFile)
      .add_option("data-start-row", "0-based line index of the header row", dataStartRow)
      .add_option("delimiter", "Field delimiter: auto, comma, tab, space or a single character", delimStr)
      .add_option("x-col", "Column name of the x coordinates", xcol)
      .add_option("y-col", "Column name of the y coordinates", ycol)
      .add_option("u-col", "Column name of the x velocities", ucol)
      .add_option("v-col", "Column name of the y velocities", vcol)
      .add_option("px-conversion", "Raw units per grid step (with --grid-step: units per pixel)", pxConversion)
      .add_option("grid-step", "Spacing between observations in pixels (legacy)", gridStep)
      .add_option("out-field", "Write the dense field as x, y, u, v rows", outField)
      .add_option("debug", "Debug", debug_);

    try {
        pl.readArgs(argc, argv);
    } catch (const std::exception &ex) {
        std::cerr << "Error parsing options: " << ex.what() << "\n";
        pl.print_help();
        return 1;
    }
    if (debug_ > 0) {
        logger::Logger::getInstance().setLevel(logger::LogLevel::DEBUG);
    }

    SweepConfig config;
    try {
        if (!configFile.empty()) {
            config = loadSweepConfig(configFile);
        }
        if (pl.is_set("data-start-row")) config.dataStartRow = dataStartRow;
        if (pl.is_set("delimiter")) config.delimiter = parseDelimiter(delimStr);
        if (pl.is_set("x-col")) config.columns.x = xcol;
        if (pl.is_set("y-col")) config.columns.y = ycol;
        if (pl.is_set("u-col")) config.columns.u = ucol;
        if (pl.is_set("v-col")) config.columns.v = vcol;
        if (pl.is_set("px-conversion")) config.pixelToUnit = pxConversion;
        if (pl.is_set("grid-step")) config.gridStepSize = gridStep;
        config.validate();
    } catch (const VelcorrError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    SampleTable samples = readSampleTable(inFile, config.dataStartRow, config.delimiter);
    RadiusSweep sweep(config);
    auto [scale, field] = sweep.prepareField(samples);

    printf("##Samples: %zu\n", samples.nRows());
    printf("##Conversion factor: %.12g (%s)\n", scale.factor(), scale.inferred() ? "inferred" : "given");
    printf("##Grid: %d x %d (height x width)\n", field.height(), field.width());
    printf("##Observed cells: %zu of %zu (%.2f%%)\n", field.nObserved(), field.nCells(),
        field.nCells() > 0 ? 100.0 * field.nObserved() / field.nCells() : 0.0);
    const int32_t rMax = std::min(field.height(), field.width()) - 1;
    if (rMax >= 1) {
        printf("##Largest valid radius: %d (%.10g units)\n", rMax, rMax * scale.factor());
    } else {
        printf("##Largest valid radius: none\n");
    }

    if (!outField.empty()) {
        char outDelim = ',';
        if (outField.size() >= 4 && toLower(outField.substr(outField.size() - 4)) == ".tsv") {
            outDelim = '\t';
        }
        writeFieldTable(outField, field, outDelim);
        notice("Wrote dense field to %s", outField.c_str());
    }
    return 0;
}
