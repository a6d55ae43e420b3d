#include <iostream>

#include <jref/jref.h>

using namespace jref;

// usage: jref_basic <document>[#<pointer>]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <document>[#<pointer>]" << std::endl;
        return 1;
    }

    DocumentStore store;
    Resolver resolver{store};

    try {
        auto entry = View::from_address(resolver, Address::parse(argv[1]));
        auto p_view = std::get_if<View>(&entry);
        if (p_view == nullptr) {
            std::cout << std::get<Object>(entry) << std::endl;
            return 0;
        }

        // walk one level, with references followed
        std::cout << p_view->address() << std::endl;
        for (auto& key : p_view->keys()) {
            auto child = p_view->get(key);
            if (auto p_child = std::get_if<View>(&child); p_child) {
                std::cout << "  " << key << " -> " << p_child->address() << std::endl;
            } else {
                std::cout << "  " << key << " = " << std::get<Object>(child) << std::endl;
            }
        }

        // a cyclic result can't be printed
        bool is_cyclic = false;
        try {
            p_view->expand();
        } catch (const ReferenceParseError&) {
            is_cyclic = true;
        }

        auto result = materialize(*p_view);
        if (is_cyclic) {
            std::cout << "<cyclic document with " << result.size() << " top-level entries>" << std::endl;
        } else {
            result.to_json(std::cout, 2);
            std::cout << std::endl;
        }
    } catch (const JrefException& error) {
        std::cerr << error.what() << std::endl;
        return 1;
    }
}
