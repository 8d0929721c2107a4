#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include "utils.h"
#include "params.h"
#include "error.hpp"

#define VELCORR_VERSION "1.1.0"

// Sub-commands, each parses its own options from argv[1..]
int32_t cmdVelocityCorr(int32_t argc, char** argv);
int32_t cmdGridInfo(int32_t argc, char** argv);
