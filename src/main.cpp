#include <exception>
#include <iostream>

#include "app/urlbar_app.hpp"

int main() {
    try {
        urlbar::UrlbarApp app;
        return app.run();
    } catch (const std::exception &e) {
        std::cerr << "urlbar: " << e.what() << std::endl;
        return 1;
    }
}
