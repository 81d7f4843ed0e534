#pragma once

#include <iosfwd>
#include <memory>

namespace nicefind {

class App {
public:
    App();
    ~App();

    int run(int argc, char** argv);
    int run(int argc, char** argv, std::ostream& output, std::ostream& diagnostics);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nicefind
