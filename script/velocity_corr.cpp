#include "velcorr.h"
#include "radiussweep.hpp"
#include "sweepconfig.hpp"
#include "table_io.hpp"

/*
    Input: a delimited table with one row per PIV vector (x, y, u, v columns,
    extra columns ignored). Positions are mapped to an integer grid using
    --grid-step and --px-conversion if given, otherwise the grid step is
    inferred from the coordinates.
    Output: one row per radius with the correlation score and the number of
    centers with >= 1, >= 4 and 8 valid neighbors.
*/

int32_t cmdVelocityCorr(int32_t argc, char** argv) {
    std::string inFile, outFile, outJson, configFile;
    std::string xcol, ycol, ucol, vcol;
    std::string delimStr = "auto", averagingStr = "arithmetic";
    int32_t dataStartRow = 0;
    int32_t minRadius = 1, maxRadius = 25, radiusStep = 1;
    double pxConversion = -1;
    int32_t gridStep = -1;
    bool directional = false;
    int32_t threads = 1;
    bool quiet = false;
    int32_t debug_ = 0;

    ParamList pl;
    // Input options
    pl.add_option("in", "Input table (.csv, or .tsv for tab-delimited)", inFile, true)
      .add_option("config", "JSON configuration file; command line options take precedence", configFile)
      .add_option("data-start-row", "0-based line index of the header row", dataStartRow)
      .add_option("delimiter", "Field delimiter: auto, comma, tab, space or a single character", delimStr)
      .add_option("x-col", "Column name of the x coordinates (default: x [px])", xcol)
      .add_option("y-col", "Column name of the y coordinates (default: y [px])", ycol)
      .add_option("u-col", "Column name of the x velocities (default: u [px/frame])", ucol)
      .add_option("v-col", "Column name of the y velocities (default: v [px/frame])", vcol);
    // Grid and sweep options
    pl.add_option("px-conversion", "Raw units per grid step; inferred from the coordinates if absent (with --grid-step: units per pixel)", pxConversion)
      .add_option("grid-step", "Spacing between observations in pixels (legacy)", gridStep)
      .add_option("min-radius", "Smallest radius in grid steps", minRadius)
      .add_option("max-radius", "Largest radius in grid steps", maxRadius)
      .add_option("radius-step", "Radius increment in grid steps", radiusStep)
      .add_option("averaging", "Average of the 8 directions: arithmetic or fisher", averagingStr)
      .add_option("threads", "Number of threads to use", threads);
    // Output options
    pl.add_option("out", "Output table", outFile, true)
      .add_option("out-json", "Also write results and run metadata as JSON", outJson)
      .add_option("directional", "Add the 8 per-direction correlations to the output", directional)
      .add_option("quiet", "Only report warnings and errors", quiet)
      .add_option("debug", "Debug", debug_);

    try {
        pl.readArgs(argc, argv);
        pl.print_options();
    } catch (const std::exception &ex) {
        std::cerr << "Error parsing options: " << ex.what() << "\n";
        pl.print_help();
        return 1;
    }

    if (debug_ > 0) {
        logger::Logger::getInstance().setLevel(logger::LogLevel::DEBUG);
    } else if (quiet) {
        logger::Logger::getInstance().setLevel(logger::LogLevel::WARNING);
    }

    // Invalid option values are usage errors, reported like parse failures
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
        if (pl.is_set("min-radius")) config.minRadius = minRadius;
        if (pl.is_set("max-radius")) config.maxRadius = maxRadius;
        if (pl.is_set("radius-step")) config.radiusStep = radiusStep;
        if (pl.is_set("averaging")) config.averaging = parseCorrAveraging(averagingStr);
        if (pl.is_set("directional")) config.directional = directional;
        if (pl.is_set("threads")) config.threads = threads;
        config.validate();
    } catch (const VelcorrError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << "\n";
        return 1;
    }

    if (!checkOutputWritable(outFile))
        error("Output file is not writable: %s", outFile.c_str());
    if (!outJson.empty() && !checkOutputWritable(outJson))
        error("Output file is not writable: %s", outJson.c_str());

    SampleTable samples = readSampleTable(inFile, config.dataStartRow, config.delimiter);
    RadiusSweep sweep(config);
    SweepOutput result = sweep.run(samples);

    char outDelim = ',';
    if (outFile.size() >= 4 && toLower(outFile.substr(outFile.size() - 4)) == ".tsv") {
        outDelim = '\t';
    }
    writeSweepTable(outFile, result.rows, outDelim, config.directional);
    if (!outJson.empty()) {
        writeSweepJson(outJson, result, config);
        notice("Wrote JSON summary to %s", outJson.c_str());
    }
    return 0;
}
