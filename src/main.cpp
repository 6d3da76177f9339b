#include "stepflow/common/logging.hpp"
#include "stepflow/common/stepflow_exceptions.hpp"
#include "stepflow/common/workflow_definition.hpp"
#include "stepflow/execution/workflow.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>

namespace
{

constexpr int kExitAllSucceeded = 0;
constexpr int kExitStepsFailed = 1;
constexpr int kExitError = 2;

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int)
{
    g_interrupted.store(true);
}

void print_usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options] <workflow.yaml>\n"
              << "\n"
              << "Options:\n"
              << "  --concurrency N   Maximum steps running at once (default 1)\n"
              << "  --timeout-ms T    Per-step timeout in milliseconds, 0 for none (default 0)\n"
              << "  --keep-going      Keep running independent steps after a failure\n"
              << "  --log-level L     trace, debug, info, warn, error (default info)\n"
              << "  --help            Show this message\n";
}

struct CliArgs
{
    std::string workflow_path;
    std::string log_level{"info"};
    stepflow::SchedulerConfig config;
};

size_t parse_count(const std::string& flag, const std::string& value)
{
    size_t pos = 0;
    unsigned long long parsed = 0;
    try
    {
        parsed = std::stoull(value, &pos);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
    if (pos != value.size() || value[0] == '-')
    {
        throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
    }
    return static_cast<size_t>(parsed);
}

CliArgs parse_args(int argc, char** argv)
{
    CliArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--concurrency")
        {
            args.config.concurrency = parse_count(arg, value());
        }
        else if (arg == "--timeout-ms")
        {
            args.config.step_timeout = std::chrono::milliseconds(parse_count(arg, value()));
        }
        else if (arg == "--keep-going")
        {
            args.config.abort_on_failure = false;
        }
        else if (arg == "--log-level")
        {
            args.log_level = value();
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        }
        else if (args.workflow_path.empty())
        {
            args.workflow_path = arg;
        }
        else
        {
            throw std::invalid_argument("Only one workflow file may be given");
        }
    }
    if (args.workflow_path.empty())
    {
        throw std::invalid_argument("No workflow file given");
    }
    return args;
}

} // namespace

int main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--help")
        {
            print_usage(argv[0]);
            return kExitAllSucceeded;
        }
    }

    CliArgs args;
    try
    {
        args = parse_args(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return kExitError;
    }

    stepflow::init_logging(args.log_level);

    try
    {
        stepflow::WorkflowOptions options;
        options.config = args.config;
        options.notifier = std::make_shared<stepflow::LogNotifier>();
        options.sink = std::make_shared<stepflow::InheritedSink>();

        auto workflow = stepflow::load_workflow_from_file(args.workflow_path, std::move(options));

        // Ctrl-C stops dispatch; running steps are left to finish.
        std::signal(SIGINT, handle_interrupt);
        std::signal(SIGTERM, handle_interrupt);
        std::atomic<bool> finished{false};
        std::thread interrupt_watcher([&] {
            while (!finished.load())
            {
                if (g_interrupted.exchange(false))
                {
                    spdlog::warn("Interrupted; waiting for running steps to finish");
                    workflow->request_stop();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        stepflow::ExecutionResult result;
        std::exception_ptr run_error;
        try
        {
            result = workflow->run();
        }
        catch (...)
        {
            run_error = std::current_exception();
        }
        finished.store(true);
        interrupt_watcher.join();
        if (run_error)
        {
            std::rethrow_exception(run_error);
        }

        for (size_t i = 0; i < result.failed_steps.size(); ++i)
        {
            spdlog::error("{}: {}", workflow->step(result.failed_steps[i]).name(),
                          result.error_messages[i]);
        }
        for (auto sidx : result.unscheduled_steps)
        {
            spdlog::warn("{}: not run", workflow->step(sidx).name());
        }
        return result.success ? kExitAllSucceeded : kExitStepsFailed;
    }
    catch (const stepflow::WorkflowLoadError& e)
    {
        spdlog::critical("{}", e.what());
    }
    catch (const stepflow::WorkflowValidationError& e)
    {
        spdlog::critical("{}", e.what());
    }
    catch (const stepflow::StepflowError& e)
    {
        spdlog::critical("Workflow aborted ({}): {}", stepflow::to_string(e.code()), e.what());
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
    }
    return kExitError;
}
