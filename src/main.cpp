#include "pitwall/app.hpp"

int main(int argc, char *argv[]) {
    pitwall::App app;
    return app.run(argc, argv);
}
