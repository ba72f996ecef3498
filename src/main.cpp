#include "tempest/app.hpp"

int main(int argc, char *argv[]) {
    tempest::App app;
    return app.run(argc, argv);
}
