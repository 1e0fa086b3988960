#include <string>
#include <vector>

#include "app/FinDocApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    findoc::app::FinDocApp app(std::move(args));
    return app.Run();
}
