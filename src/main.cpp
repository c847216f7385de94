#include "jobtmpl/engine.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " <template-file> [Name=Value ...]\n";
}

jobtmpl::JobParameterInputs parse_inputs(int argc, char** argv)
{
    jobtmpl::JobParameterInputs inputs;
    for (int i = 2; i < argc; ++i)
    {
        const std::string arg{argv[i]};
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0)
        {
            throw std::invalid_argument("Expected Name=Value, got '" + arg + "'");
        }
        inputs[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
    return inputs;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::cout << "\n\n====== jobtmpl ======\n" << std::flush;

        auto validation = jobtmpl::validate_file(argv[1]);
        for (const auto& item : validation.diagnostics.items())
        {
            const char* label = item.severity == jobtmpl::DiagnosticSeverity::Error ? "error" : "warning";
            std::cerr << label << ": " << item.to_string() << "\n";
        }
        if (!validation.ok())
        {
            std::cout << "\n\n====== invalid template ======\n" << std::flush;
            return EXIT_FAILURE;
        }

        auto job = jobtmpl::create_job(validation.job_template, parse_inputs(argc, argv));
        std::cout << "Job: " << job->name() << "\n" << std::flush;

        jobtmpl::JobRunOptions options;
        options.session.on_event = [](const jobtmpl::SessionEvent& event)
        {
            std::cout << event.to_string() << "\n" << std::flush;
        };
        auto result = jobtmpl::run_job(job, options);

        std::cout << result.summary() << "\n";
        for (const auto& message : result.error_messages)
        {
            std::cout << "  " << message << "\n";
        }
        if (!result.success)
        {
            std::cout << "\n\n====== job failed ======\n" << std::flush;
            return EXIT_FAILURE;
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
