#include "sift/app.h"

int main(int argc, char** argv) {
    sift::App app;
    return app.run(argc, argv);
}
