#include "app/app.h"
#include "app/options.h"

#include <iostream>

int main(int argc, char** argv) {
    using namespace needledrop;

    auto parsed = app::parseOptions(argc, argv, "needledrop");
    if (parsed.showHelp || parsed.showVersion) {
        return 0;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << "needledrop: " << parsed.errorMessage << std::endl;
        app::printHelp("needledrop");
        return 2;
    }

    app::App daemon(*parsed.options);
    return daemon.run();
}
