// -----------------------------
// Examples (compile-time guard)
// -----------------------------
// Define SPLAY_TREE_MAP_EXAMPLE_MAIN to compile and run examples showing how accesses reshape the tree.
//
// Example 1: insert / search / remove, dumping the tree after every mutating call the way a
//            rendering layer would redraw it.
// Example 2: queries that do not splay (min, max, contains, in-order walk) leave the root alone.
// Example 3: a sorted insertion run builds a linear tree; one search roughly halves its height.
// The example target in CMakeLists.txt defines the guard.

#ifdef SPLAY_TREE_MAP_EXAMPLE_MAIN
#include <iostream>
#include <string>
#include <stdexcept>
#include <cmath>

#include "splay_tree_map.hpp"

namespace {

void show(const char* what, const SplayTreeMap<int, std::string>& t) {
    std::cout << "-- " << what << "\n";
    t.tree_dump(std::cout);
}

} // namespace

int main() {
    using Map = SplayTreeMap<int, std::string>;
    {
        std::cout << "Example 1: accesses move keys to the root\n";
        Map t;
        t.insert(10, "a");
        show("insert 10", t);
        t.insert(4, "b");
        show("insert 4", t);
        t.insert(12, "c");
        show("insert 12", t);

        auto hit = t.search(4);
        std::cout << "search 4: " << (hit ? hit->value() : std::string("not found")) << "\n";
        show("after search 4", t);

        auto miss = t.search(11);
        std::cout << "search 11: " << (miss ? "found" : "not found")
                  << ", root is now " << t.root()->key() << "\n";

        t.remove(10);
        show("remove 10", t);

        t.insert(4, "updated");
        std::cout << "insert 4 again -> value " << t.search(4)->value() << ", size " << t.size() << "\n";
    }

    {
        std::cout << "\nExample 2: queries leave the shape alone\n";
        Map t{{50, "x"}, {20, "y"}, {70, "z"}, {60, "w"}};
        int root_before = t.root()->key();
        std::cout << "min " << t.min()->key() << ", max " << t.max()->key()
                  << ", contains 20? " << (t.contains(20) ? "yes" : "no") << "\n";
        std::cout << "in order:";
        t.for_each_in_order([](Map::node_view n) { std::cout << ' ' << n.key() << ':' << n.value(); });
        std::cout << "\nroot unchanged? " << (t.root()->key() == root_before ? "yes" : "no") << "\n";
        std::cout << "tree json: " << t.tree_json() << "\n";
    }

    {
        std::cout << "\nExample 3: splaying a degenerate tree\n";
        Map t;
        for (int i = 1; i <= 64; ++i) t.insert(i, std::to_string(i));
        std::cout << "height after sorted inserts: " << t.height() << "\n";
        t.search(1);
        std::cout << "height after search(1): " << t.height()
                  << ", rotations so far: " << t.rotation_count() << "\n";

        std::string diag;
        if (!t.validate_invariants(&diag)) {
            std::cerr << diag;
            return 1;
        }
    }

    {
        std::cout << "\nExample 4: NaN keys are rejected\n";
        SplayTreeMap<double, int> d;
        try {
            d.insert(std::nan(""), 1);
        } catch (const std::invalid_argument& e) {
            std::cout << "insert rejected: " << e.what() << ", size " << d.size() << "\n";
        }
    }

    return 0;
}
#endif // SPLAY_TREE_MAP_EXAMPLE_MAIN
