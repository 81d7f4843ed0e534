#include "nicefind/app.h"

#include <exception>
#include <iostream>
#include <string>

#include "nicefind/cli.h"
#include "nicefind/config.h"
#include "nicefind/logger.h"
#include "nicefind/perf.h"
#include "nicefind/renderer.h"
#include "nicefind/search.h"

namespace nicefind {

class App::Impl {
public:
    int run(int argc, char** argv, std::ostream& output, std::ostream& diagnostics) {
        Config::instance().set_program_name(argc > 0 && argv ? argv[0] : "nicefind");

        Cli cli;
        Config::Options options;
        try {
            options = cli.parse(argc, argv);
        } catch (const CLI::ParseError& ex) {
            return cli.exit(ex);
        }
        Config::instance().set_options(options);
        Logger::instance().set_level(options.log_level);

        if (options.dump_markdown) {
            output << cli.usage_markdown();
            return 0;
        }

        const auto& active = Config::instance().options();
        try {
            Renderer renderer{active, output, diagnostics};
            {
                perf::ScopedTimer timer{std::string{"search:"} + active.filter.root.string()};
                auto stream = start_search(active.filter, active.channel_capacity);
                while (auto result = stream.next()) {
                    renderer.render(*result);
                }
            }
            renderer.finish();
            return renderer.failures() == 0 ? 0 : 1;
        } catch (const std::exception& ex) {
            diagnostics << Config::instance().program_name() << ": error: " << ex.what() << '\n';
            return 2;
        }
    }
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv, std::cout, std::cerr);
}

int App::run(int argc, char** argv, std::ostream& output, std::ostream& diagnostics) {
    return impl_->run(argc, argv, output, diagnostics);
}

} // namespace nicefind
