#include <reso_client/cli/command_executor.hpp>
#include <reso_client/cli/command_line.hpp>
#include <reso_client/cli/output_formatter.hpp>
#include <reso_client/client/http_transport.hpp>
#include <reso_client/client/reso_client.hpp>
#include <reso_client/config/config_loader.hpp>
#include <reso_client/core/log.hpp>
#include <reso_client/core/terminal.hpp>
#include <reso_client/core/version.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace reso_client;

Result<std::unique_ptr<ILogSink>, Error> MakeLogSink(const AppConfig& config,
                                                     bool use_color) {
    std::unique_ptr<ILogSink> console = std::make_unique<ColorConsoleSink>(use_color);
    if (!config.log_file.has_value()) {
        return Result<std::unique_ptr<ILogSink>, Error>::Ok(std::move(console));
    }
    auto file = FileSink::Open(*config.log_file);
    if (file.IsErr()) {
        return Result<std::unique_ptr<ILogSink>, Error>::Err(file.Error());
    }
    return Result<std::unique_ptr<ILogSink>, Error>::Ok(
        std::make_unique<TeeSink>(std::move(console), std::move(file).Value()));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace reso_client;

    // Step 1: Parse the command line.
    auto parsed = ParseCommandLine(argc, argv);
    if (parsed.IsErr()) {
        OutputFormatter(false, false).PrintError(parsed.Error());
        return parsed.Error().ExitCode();
    }
    const auto inv = std::move(parsed).Value();

    if (inv.show_version) {
        std::cout << "reso-client " << kVersion << "\n";
        return kExitSuccess;
    }
    if (inv.help_text.has_value()) {
        std::cout << *inv.help_text;
        return kExitSuccess;
    }

    const bool json_output = inv.overrides.json_output;

    // Step 2: Environment < YAML < CLI.
    auto layered = LoadLayeredConfig(inv.config_path, inv.overrides);
    if (layered.IsErr()) {
        OutputFormatter(json_output, false).PrintError(layered.Error());
        return layered.Error().ExitCode();
    }
    const auto config = std::move(layered).Value();

    // Step 3: Logging.
    const bool log_color = ShouldUseColor(inv.color_choice, IsStderrTty());
    const bool out_color = ShouldUseColor(inv.color_choice, IsStdoutTty());
    OutputFormatter fmt(config.json_output, out_color);

    auto level = ResolveLogLevel(config, inv.overrides, inv.verbosity);
    if (level.IsErr()) {
        fmt.PrintError(level.Error());
        return level.Error().ExitCode();
    }
    auto sink = MakeLogSink(config, log_color);
    if (sink.IsErr()) {
        fmt.PrintError(sink.Error());
        return sink.Error().ExitCode();
    }
    InitGlobalLogger(std::move(sink).Value(), level.Value());

    // Step 4: Validate the connection settings.
    auto valid = ValidateConfig(config.connection);
    if (valid.IsErr()) {
        fmt.PrintError(valid.Error());
        return valid.Error().ExitCode();
    }
    LogDebug("config", config.connection.Describe());

    // Step 5: Transport and client.
    HttpTransportOptions options;
    options.connect_timeout = std::chrono::seconds(config.connection.Timeout());
    options.read_timeout = std::chrono::seconds(config.connection.Timeout());
    options.disable_tls_verify = config.connection.insecure;
    if (options.disable_tls_verify) {
        LogWarn("config", "TLS certificate verification disabled");
    }

    HttplibTransport transport(options);
    ResoClient client(config.connection, transport);

    // Step 6: Run the command.
    return ExecuteCommand(inv.command, inv.args, client, fmt);
}
