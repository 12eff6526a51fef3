#pragma once

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "version.hpp"
#include "native.h"
#include "utils.hpp"
#include "config.hpp"
#include "chain.hpp"
#include "rpc_client.hpp"
#include "deployer.hpp"
