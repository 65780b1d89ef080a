#include "app/OdsManagerApp.hpp"

int main(int argc, char** argv) {
    odsmanager::app::OdsManagerApp app;
    return app.Run(argc, argv);
}
