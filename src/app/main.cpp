// ============================================================================
// SplitWindow - Land Surface Temperature from Landsat 8 TIRS
// ============================================================================
// Command-line entry point: builds a split-window estimator from a TOML
// scene description, reports the resolved model and evaluates brightness
// temperature pairs.
// ============================================================================

#include "core/Log.hpp"
#include "core/Config.hpp"
#include "core/CoefficientTable.hpp"
#include "core/EmissivityTable.hpp"
#include "io/CoefficientTableIO.hpp"
#include "lst/SplitWindowLST.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <iostream>
#include <utility>

using namespace splitwindow;

namespace {

struct CommandLine {
    String configPath;
    Optional<f64> t10;
    Optional<f64> t11;
    String exportPath;
    bool help = false;
};

void PrintUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <config.toml> [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --t10 <K>                      Brightness temperature of band 10\n";
    std::cout << "  --t11 <K>                      Brightness temperature of band 11\n";
    std::cout << "  --export-coefficients <path>   Write the active coefficient table to HDF5\n";
    std::cout << "  --help                         Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " assets/configs/landsat8_cropland.toml\n";
    std::cout << "  " << programName << " assets/configs/landsat8_cropland.toml --t10 300 --t11 295\n";
}

Optional<f64> ParseNumber(StringView text) {
    f64 value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

Result<CommandLine, String> ParseCommandLine(int argc, char* argv[]) {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        String arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        }
        else if ((arg == "--t10" || arg == "--t11") && i + 1 < argc) {
            auto value = ParseNumber(argv[++i]);
            if (!value) {
                return Result<CommandLine, String>::Err("Invalid number for " + arg + ": " + argv[i]);
            }
            (arg == "--t10" ? cmd.t10 : cmd.t11) = *value;
        }
        else if (arg == "--export-coefficients" && i + 1 < argc) {
            cmd.exportPath = argv[++i];
        }
        else if (!arg.empty() && arg[0] != '-' && cmd.configPath.empty()) {
            cmd.configPath = arg;
        }
        else {
            return Result<CommandLine, String>::Err("Unknown or incomplete argument: " + arg);
        }
    }

    if (cmd.t10.has_value() != cmd.t11.has_value()) {
        return Result<CommandLine, String>::Err("--t10 and --t11 must be given together");
    }

    return cmd;
}

// Built-in table unless coefficients.file names an HDF5 table
Optional<CoefficientTable> LoadCoefficientTable(const Config& config) {
    if (!config.Has("coefficients.file")) {
        SW_LOG_INFO("Using the published Landsat 8 coefficient table");
        return CoefficientTable::Published();
    }

    String path = config.Get<String>("coefficients.file");
    SW_LOG_INFO("Loading coefficient table: {}", path);
    return CoefficientTableIO::LoadHDF5(path);
}

Vector<std::pair<f64, f64>> CollectSamples(const Config& config, const CommandLine& cmd) {
    Vector<std::pair<f64, f64>> samples;

    auto t10 = config.GetArray<f64>("sample.t10");
    auto t11 = config.GetArray<f64>("sample.t11");
    if (t10.size() != t11.size()) {
        SW_LOG_WARN("sample.t10 has {} values but sample.t11 has {}, using the first {}",
                    t10.size(), t11.size(), std::min(t10.size(), t11.size()));
    }
    for (usize i = 0; i < std::min(t10.size(), t11.size()); ++i) {
        samples.emplace_back(t10[i], t11[i]);
    }

    if (cmd.t10 && cmd.t11) {
        samples.emplace_back(*cmd.t10, *cmd.t11);
    }
    return samples;
}

} // namespace

int main(int argc, char* argv[]) {
    auto cmdResult = ParseCommandLine(argc, argv);
    if (!cmdResult.has_value()) {
        std::cerr << cmdResult.error() << "\n";
        PrintUsage(argv[0]);
        return 1;
    }
    CommandLine cmd = cmdResult.value();

    if (cmd.help) {
        PrintUsage(argv[0]);
        return 0;
    }

    if (cmd.configPath.empty()) {
        std::cerr << "No configuration file provided\n";
        PrintUsage(argv[0]);
        return 1;
    }

    // ========================================================================
    // Load Configuration
    // ========================================================================
    auto configResult = Config::Load(std::filesystem::path(cmd.configPath));
    if (!configResult.has_value()) {
        Log::Init("", Log::Level::Info);
        SW_LOG_ERROR("Failed to load configuration: {}", configResult.error());
        Log::Shutdown();
        return 1;
    }
    Config config = configResult.value();

    // ========================================================================
    // Initialize Logging
    // ========================================================================
    String levelName = config.Get<String>("log.level", "info");
    auto level = Log::ParseLevel(levelName);
    String logFile = config.Get<String>("log.file", "splitwindow.log");
    Log::Init(logFile.c_str(), level.value_or(Log::Level::Info));
    if (!level) {
        SW_LOG_WARN("Unknown log.level '{}', using info", levelName);
    }

    SW_LOG_INFO("========================================");
    SW_LOG_INFO("  Split-Window LST for Landsat 8 TIRS");
    SW_LOG_INFO("========================================");
    SW_LOG_DEBUG("Configuration file: {}", cmd.configPath);

    auto table = LoadCoefficientTable(config);
    if (!table) {
        SW_LOG_ERROR("No usable coefficient table");
        Log::Shutdown();
        return 1;
    }

    for (const auto& bounds : table->Enumerate()) {
        SW_LOG_DEBUG("  Subrange {}: ({}, {})", bounds.key, bounds.low, bounds.high);
    }

    if (!cmd.exportPath.empty()) {
        if (!CoefficientTableIO::SaveHDF5(cmd.exportPath, *table)) {
            Log::Shutdown();
            return 1;
        }
    }

    // ========================================================================
    // Build Estimator
    // ========================================================================
    auto estimatorResult = SplitWindowLST::FromConfig(config, *table, EmissivityTable::Published());
    if (!estimatorResult.has_value()) {
        SW_LOG_ERROR("Failed to build split-window estimator: {}", estimatorResult.error());
        Log::Shutdown();
        return 1;
    }
    const SplitWindowLST& estimator = estimatorResult.value();

    SW_LOG_INFO("Citation: {}", kCitation);
    SW_LOG_INFO("Subrange: {}", estimator.GetSubrangeKey());
    SW_LOG_INFO("\n{}", estimator.ToString());
    SW_LOG_INFO("Mapcalc: {}", estimator.RenderFormula());
    SW_LOG_INFO("{}", estimator.ReportRMSE());

    // ========================================================================
    // Evaluate Samples
    // ========================================================================
    int exitCode = 0;
    for (const auto& [t10, t11] : CollectSamples(config, cmd)) {
        try {
            std::cout << estimator.ReportLST(t10, t11) << "\n";
        }
        catch (const SplitWindowError& err) {
            SW_LOG_ERROR("{}", err.what());
            exitCode = 1;
        }
    }

    Log::Shutdown();
    return exitCode;
}
