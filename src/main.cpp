#include "nicefind/app.h"

int main(int argc, char** argv) {
    nicefind::App app;
    return app.run(argc, argv);
}
