/*
* File: main
* Project: prism
*
* Created on: 1/23/2026
*/

#include <iostream>

#include "app.hpp"
#include "config.hpp"

int main(int argc, char** argv) {
    try {
        prism::SceneConfig config;
        if (argc > 1) {
            config = prism::loadSceneConfig(argv[1]);
        }

        prism::App app(config);
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
