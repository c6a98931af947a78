// splay_tree_map.hpp
// Self-adjusting (splay) binary search tree map with allocator-aware nodes and invariant diagnostics.
//
// - C++17 header-only.
// - Every access (search/insert/remove/splay) moves the accessed key, or the last node visited on a
//   failed search, to the root using zig / zig-zig / zig-zag rotations (Sleator & Tarjan).
// - splay is iterative: the descent records two-level steps on an explicit path stack and the
//   unwinding pass applies the rotations, so a degenerate (linear) tree does not exhaust the call stack.
//   The resulting shape is identical to the classic recursive formulation.
// - remove uses split/join: splay the key to the root, drop it, splay the left subtree around the
//   removed key (which brings its maximum up with an empty right child) and hang the right subtree there.
// - min/max/contains/in-order traversal are pure queries and never change the tree shape.
// - Keys must be totally ordered via operator< (checked at compile time). Floating point NaN keys are
//   rejected with std::invalid_argument.
//
// Diagnostics:
//     * validate_invariants_json(std::string& out_json) const
//         - Validates BST order (strict, so duplicates are violations), that no node is reachable twice
//           (no sharing, no cycles) and that size() matches the node count.
//     * validate_invariants(std::string* out) const
//         - Human-readable wrapper (JSON + tree dump; the dump is skipped past 256 levels).
//     * tree_dump(std::ostream& os, bool show_addresses = false) const
//     * tree_json() const
//         - Nested {"key","value","children":[left,right]} structure for rendering layers.
//
// Usage:
//   SplayTreeMap<int, std::string> t;
//   t.insert(10, "a");
//   t.insert(4, "b");
//   if (auto n = t.search(4)) std::cout << n->value();   // 4 is now the root
//   t.remove(10);
//   for (const auto& kv : t) std::cout << kv.first;      // ascending, does not splay
//
// Dump helpers require Key (and, for tree_json, T) to be streamable (operator<<). That includes
// validate_invariants(&out), whose report embeds a tree dump for trees up to 256 levels deep.

#ifndef SPLAY_TREE_MAP_HPP
#define SPLAY_TREE_MAP_HPP

#include <memory>
#include <utility>
#include <initializer_list>
#include <functional>
#include <iterator>
#include <type_traits>
#include <limits>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <iostream>
#include <string>
#include <sstream>
#include <vector>
#include <queue>
#include <unordered_set>

namespace splay_tree_map_detail {

template <typename K, typename = void>
struct is_less_than_comparable : std::false_type {};

template <typename K>
struct is_less_than_comparable<K, std::void_t<decltype(std::declval<const K&>() < std::declval<const K&>())>>
    : std::is_convertible<decltype(std::declval<const K&>() < std::declval<const K&>()), bool> {};

} // namespace splay_tree_map_detail

template <
    typename Key,
    typename T,
    typename Alloc = std::allocator<std::pair<const Key, T>>
>
class SplayTreeMap {
    static_assert(splay_tree_map_detail::is_less_than_comparable<Key>::value,
                  "SplayTreeMap requires a key type totally ordered by operator<");

public:
    // STL-like typedefs
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<const Key, T>;
    using key_compare     = std::less<Key>;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

private:
    // Children are owned exclusively by their parent slot; there is no parent pointer.
    struct Node {
        value_type value;
        Node* left;
        Node* right;
        template <typename... Args>
        explicit Node(Args&&... args)
            : value(std::forward<Args>(args)...), left(nullptr), right(nullptr) {}
    };

    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

public:
    // Read-only handle on a node. Survives rotations; invalidated when its node is removed.
    class node_view {
        friend class SplayTreeMap;
    public:
        const key_type& key() const noexcept { return node_->value.first; }
        const mapped_type& value() const noexcept { return node_->value.second; }

        bool has_left() const noexcept { return node_->left != nullptr; }
        bool has_right() const noexcept { return node_->right != nullptr; }

        std::optional<node_view> left() const {
            if (!node_->left) return std::nullopt;
            return node_view(node_->left);
        }
        std::optional<node_view> right() const {
            if (!node_->right) return std::nullopt;
            return node_view(node_->right);
        }

        bool operator==(const node_view& o) const noexcept { return node_ == o.node_; }
        bool operator!=(const node_view& o) const noexcept { return node_ != o.node_; }

    private:
        const Node* node_;
        explicit node_view(const Node* n) noexcept : node_(n) {}
    };

    // Forward in-order iterator. Walks with an explicit stack holding the unvisited left spine,
    // so iteration never splays and never recurses.
    class const_iterator {
        friend class SplayTreeMap;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = SplayTreeMap::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = SplayTreeMap::difference_type;

        const_iterator() = default;
        reference operator*() const { return stack_.back()->value; }
        pointer operator->() const { return &stack_.back()->value; }

        const_iterator& operator++() {
            const Node* cur = stack_.back();
            stack_.pop_back();
            push_left_spine(cur->right);
            return *this;
        }
        const_iterator operator++(int) { const_iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const const_iterator& o) const {
            if (stack_.empty() || o.stack_.empty()) return stack_.empty() == o.stack_.empty();
            return stack_.back() == o.stack_.back();
        }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        std::vector<const Node*> stack_;

        explicit const_iterator(const Node* root) { push_left_spine(root); }

        void push_left_spine(const Node* n) {
            while (n) {
                stack_.push_back(n);
                n = n->left;
            }
        }
    };

    using iterator = const_iterator;

    // constructors / destructor / assignment
    explicit SplayTreeMap(const allocator_type& alloc = allocator_type())
        : root_(nullptr), node_alloc_(alloc), size_(0), rotation_count_(0) {}

    SplayTreeMap(std::initializer_list<value_type> init, const allocator_type& alloc = allocator_type())
        : SplayTreeMap(alloc)
    {
        for (const auto& p : init) insert(p.first, p.second);
    }

    // Copies preserve the exact shape of the source tree.
    SplayTreeMap(const SplayTreeMap& other)
        : root_(nullptr),
          node_alloc_(NodeAllocTraits::select_on_container_copy_construction(other.node_alloc_)),
          size_(0), rotation_count_(0)
    {
        root_ = clone_tree(other.root_);
        size_ = other.size_;
    }

    SplayTreeMap(SplayTreeMap&& other) noexcept
        : root_(other.root_), node_alloc_(std::move(other.node_alloc_)),
          size_(other.size_), rotation_count_(other.rotation_count_)
    {
        other.root_ = nullptr;
        other.size_ = 0;
        other.rotation_count_ = 0;
    }

    SplayTreeMap& operator=(const SplayTreeMap& other) {
        if (this == &other) return *this;
        using POCCA = typename NodeAllocTraits::propagate_on_container_copy_assignment;
        if constexpr (POCCA::value) {
            if (!(NodeAllocTraits::is_always_equal::value || node_alloc_ == other.node_alloc_)) {
                clear();
                node_alloc_ = other.node_alloc_;
            }
        }
        Node* copy = clone_tree(other.root_);
        destroy_subtree(root_);
        root_ = copy;
        size_ = other.size_;
        return *this;
    }

    SplayTreeMap& operator=(SplayTreeMap&& other) noexcept(
        NodeAllocTraits::propagate_on_container_move_assignment::value ||
        NodeAllocTraits::is_always_equal::value)
    {
        if (this == &other) return *this;

        using POCMA = typename NodeAllocTraits::propagate_on_container_move_assignment;
        if constexpr (POCMA::value) {
            clear();
            node_alloc_ = std::move(other.node_alloc_);
            steal(other);
        } else {
            bool allocs_equal = NodeAllocTraits::is_always_equal::value || (node_alloc_ == other.node_alloc_);
            if (allocs_equal) {
                clear();
                steal(other);
            } else {
                // nodes cannot change allocator: rebuild them in ours, keeping the shape
                Node* copy = clone_tree(other.root_);
                clear();
                root_ = copy;
                size_ = other.size_;
                other.clear();
            }
        }
        return *this;
    }

    ~SplayTreeMap() {
        clear();
    }

    // capacity
    bool empty() const noexcept { return root_ == nullptr; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return std::numeric_limits<size_type>::max() / sizeof(Node); }

    // iterators (in-order, non-mutating)
    const_iterator begin() const { return const_iterator(root_); }
    const_iterator cbegin() const { return begin(); }
    const_iterator end() const noexcept { return const_iterator(); }
    const_iterator cend() const noexcept { return end(); }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    // structure access for rendering layers
    std::optional<node_view> root() const {
        if (!root_) return std::nullopt;
        return node_view(root_);
    }

    // Splays the tree around k: the node holding k, or the last node on the search path, becomes root.
    // Throws std::logic_error on an empty tree.
    void splay(const key_type& k) {
        check_key(k, "splay");
        if (!root_) throw std::logic_error("splay: tree is empty");
        root_ = splay_subtree(root_, k);
    }

    // Splays and returns the match. On a miss the nearest node is left at the root.
    std::optional<node_view> search(const key_type& k) {
        check_key(k, "search");
        if (!root_) return std::nullopt;
        root_ = splay_subtree(root_, k);
        if (!keys_equal(root_->value.first, k)) return std::nullopt;
        return node_view(root_);
    }

    // Inserts (k, v) at the root, or overwrites the value in place when k exists.
    // Returns true when a new node was created.
    template <typename V>
    bool insert(const key_type& k, V&& v) {
        check_key(k, "insert");

        if (!root_) {
            root_ = allocate_node(k, std::forward<V>(v));
            ++size_;
            return true;
        }

        root_ = splay_subtree(root_, k);

        if (comp_(k, root_->value.first)) {
            Node* n = allocate_node(k, std::forward<V>(v));
            n->left = root_->left;
            n->right = root_;
            root_->left = nullptr;
            root_ = n;
        } else if (comp_(root_->value.first, k)) {
            Node* n = allocate_node(k, std::forward<V>(v));
            n->right = root_->right;
            n->left = root_;
            root_->right = nullptr;
            root_ = n;
        } else {
            root_->value.second = std::forward<V>(v);
            return false;
        }
        ++size_;
        return true;
    }

    bool insert(const value_type& kv) { return insert(kv.first, kv.second); }

    // Removes k if present. Returns false (after splaying the nearest node up) when k is absent.
    bool remove(const key_type& k) {
        check_key(k, "remove");
        if (!root_) return false;

        root_ = splay_subtree(root_, k);
        if (!keys_equal(root_->value.first, k)) return false;

        Node* victim = root_;
        if (!victim->left) {
            root_ = victim->right;
        } else {
            // every key on the left is < k, so this brings the left maximum up with no right child
            Node* right = victim->right;
            root_ = splay_subtree(victim->left, k);
            root_->right = right;
        }
        deallocate_node(victim);
        --size_;
        return true;
    }

    // Plain descent; the shape is left untouched.
    bool contains(const key_type& k) const {
        check_key(k, "contains");
        return find_node_const(k) != nullptr;
    }

    std::optional<node_view> min() const {
        if (!root_) return std::nullopt;
        return node_view(minimum(root_));
    }

    // from must be a view into this tree.
    std::optional<node_view> min(node_view from) const {
        return node_view(minimum(from.node_));
    }

    std::optional<node_view> max() const {
        if (!root_) return std::nullopt;
        return node_view(maximum(root_));
    }

    // from must be a view into this tree.
    std::optional<node_view> max(node_view from) const {
        return node_view(maximum(from.node_));
    }

    // Visits nodes in ascending key order.
    template <typename F>
    void for_each_in_order(F&& fn) const {
        std::vector<const Node*> stack;
        const Node* cur = root_;
        while (cur || !stack.empty()) {
            while (cur) {
                stack.push_back(cur);
                cur = cur->left;
            }
            cur = stack.back();
            stack.pop_back();
            fn(node_view(cur));
            cur = cur->right;
        }
    }

    std::vector<node_view> in_order() const {
        std::vector<node_view> out;
        out.reserve(size_);
        for_each_in_order([&out](node_view n) { out.push_back(n); });
        return out;
    }

    void clear() noexcept {
        destroy_subtree(root_);
        root_ = nullptr;
        size_ = 0;
    }

    void swap(SplayTreeMap& other) noexcept {
        using std::swap;
        if constexpr (NodeAllocTraits::propagate_on_container_swap::value) {
            swap(node_alloc_, other.node_alloc_);
        }
        swap(root_, other.root_);
        swap(size_, other.size_);
        swap(rotation_count_, other.rotation_count_);
    }

    // Number of nodes on the longest root-to-leaf path.
    size_type height() const {
        if (!root_) return 0;
        size_type levels = 0;
        std::queue<const Node*> q;
        q.push(root_);
        while (!q.empty()) {
            ++levels;
            for (size_type i = q.size(); i > 0; --i) {
                const Node* n = q.front();
                q.pop();
                if (n->left) q.push(n->left);
                if (n->right) q.push(n->right);
            }
        }
        return levels;
    }

    key_compare key_comp() const { return comp_; }

    // Instrumentation accessors
    size_t rotation_count() const noexcept { return rotation_count_; }
    void reset_rotation_count() noexcept { rotation_count_ = 0; }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // {
    //   "valid": true|false,
    //   "size_reported": n,
    //   "size_actual": n2,
    //   "height": h,
    //   "rotation_count": r,
    //   "issues": [ "..." ],
    //   "nodes": [ { "key": "...", "left": "..."|null, "right": "..."|null, "addr": "0x..." }, ... ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;

        // explicit stack: a broken tree may be cyclic, and a valid one may be linear
        struct Bound {
            const Node* node;
            const Key* lo;
            const Key* hi;
        };
        std::unordered_set<const Node*> seen;
        std::vector<Bound> stack;
        if (root_) stack.push_back({root_, nullptr, nullptr});
        while (!stack.empty()) {
            Bound b = stack.back();
            stack.pop_back();
            const Node* n = b.node;
            if (!seen.insert(n).second) {
                std::ostringstream oss;
                oss << "Node " << key_to_string(n->value.first) << " @" << pointer_to_hex(n)
                    << " reachable from more than one parent slot";
                issues.push_back(oss.str());
                continue;
            }
            const Key& k = n->value.first;
            if (b.lo && !comp_(*b.lo, k)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(k) << " <= lower bound " << key_to_string(*b.lo);
                issues.push_back(oss.str());
            }
            if (b.hi && !comp_(k, *b.hi)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(k) << " >= upper bound " << key_to_string(*b.hi);
                issues.push_back(oss.str());
            }
            if (n->right) stack.push_back({n->right, &k, b.hi});
            if (n->left) stack.push_back({n->left, b.lo, &k});
        }

        size_t counted = seen.size();
        if (counted != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << counted;
            issues.push_back(oss.str());
        }
        if ((root_ == nullptr) != (size_ == 0)) {
            issues.push_back("root_ and size_ disagree about emptiness");
        }

        bool valid = issues.empty();

        // node list in BFS order; only safe to walk when the shape is a tree
        std::vector<std::string> node_jsons;
        if (valid && root_) {
            std::queue<const Node*> q;
            q.push(root_);
            while (!q.empty()) {
                const Node* n = q.front(); q.pop();
                std::ostringstream nj;
                nj << "{";
                nj << "\"key\":" << json_escape_and_quote(key_to_string(n->value.first)) << ",";
                if (n->left) nj << "\"left\":" << json_escape_and_quote(key_to_string(n->left->value.first)) << ",";
                else nj << "\"left\":null,";
                if (n->right) nj << "\"right\":" << json_escape_and_quote(key_to_string(n->right->value.first)) << ",";
                else nj << "\"right\":null,";
                nj << "\"addr\":\"" << pointer_to_hex(n) << "\"";
                nj << "}";
                node_jsons.push_back(nj.str());
                if (n->left) q.push(n->left);
                if (n->right) q.push(n->right);
            }
        }

        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"height\":" << (valid ? height() : 0) << ",";
        out << "\"rotation_count\":" << rotation_count_ << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid;
    }

    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        // indentation grows with depth, so deep trees would make the dump quadratic
        if (ok && height() <= dump_depth_limit) {
            oss << "Tree dump:\n" << tree_dump_to_string(false) << "\n";
        } else if (ok) {
            oss << "Tree dump omitted: height " << height() << " exceeds " << dump_depth_limit << "\n";
        }
        *out = oss.str();
        return ok;
    }

    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (!root_) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        // pre-order with an explicit stack; right is pushed first so left prints first
        struct Line {
            const Node* node;
            std::string indent;
        };
        std::vector<Line> stack;
        stack.push_back({root_, ""});
        while (!stack.empty()) {
            Line line = std::move(stack.back());
            stack.pop_back();
            const Node* n = line.node;
            if (!n) {
                oss << line.indent << "(empty)\n";
                continue;
            }
            oss << line.indent << key_to_string(n->value.first);
            if (show_addresses) oss << " @" << pointer_to_hex(n);
            oss << "\n";
            if (!n->left && !n->right) continue;
            stack.push_back({n->right, line.indent + "  R-"});
            stack.push_back({n->left, line.indent + "  L-"});
        }
        return oss.str();
    }

    // Nested node structure, absent children rendered as {"key":"empty","value":"leaf"}.
    // Returns "null" for an empty tree.
    std::string tree_json() const {
        if (!root_) return "null";
        std::ostringstream oss;
        // a pending entry is either a subtree to open or a literal closing token
        struct Pending {
            const Node* node;
            const char* token;
        };
        std::vector<Pending> stack;
        stack.push_back({root_, nullptr});
        while (!stack.empty()) {
            Pending p = stack.back();
            stack.pop_back();
            if (p.token) {
                oss << p.token;
                continue;
            }
            if (!p.node) {
                oss << "{\"key\":\"empty\",\"value\":\"leaf\"}";
                continue;
            }
            oss << "{\"key\":" << json_scalar(p.node->value.first)
                << ",\"value\":" << json_scalar(p.node->value.second)
                << ",\"children\":[";
            stack.push_back({nullptr, "]}"});
            stack.push_back({p.node->right, nullptr});
            stack.push_back({nullptr, ","});
            stack.push_back({p.node->left, nullptr});
        }
        return oss.str();
    }

private:
    enum class Step { left_left, left_right, right_right, right_left };

    struct Frame {
        Node* node;
        Step step;
    };

    static constexpr size_type dump_depth_limit = 256;

    Node* root_;
    NodeAlloc node_alloc_;
    key_compare comp_;
    size_type size_;
    size_t rotation_count_;

    // rotation helpers (these increment rotation_count_)
    // n->left must be non-null; returns the new local root.
    Node* rotate_right(Node* n) {
        Node* l = n->left;
        n->left = l->right;
        l->right = n;
        ++rotation_count_;
        return l;
    }

    // n->right must be non-null; returns the new local root.
    Node* rotate_left(Node* n) {
        Node* r = n->right;
        n->right = r->left;
        r->left = n;
        ++rotation_count_;
        return r;
    }

    // Splays the subtree rooted at n around key and returns its new root.
    //
    // Descent: while the key lies two levels below n (left-left, left-right, right-right, right-left),
    // remember n and the step taken and continue from the grandchild. A key found one level below is
    // a zig and is rotated up immediately; a missing child ends the walk at the closest node.
    //
    // Unwind: each remembered frame gets back the splayed grandchild subtree and applies
    //   zig-zig: rotate n, then rotate the new local root again
    //   zig-zag: rotate the child the opposite way, then rotate n
    // skipping the second rotation when the splayed subtree came back empty.
    Node* splay_subtree(Node* n, const key_type& key) {
        std::vector<Frame> path;
        Node* sub = nullptr;

        for (;;) {
            if (!n) {
                sub = nullptr;
                break;
            }
            if (comp_(key, n->value.first)) {
                if (!n->left) {
                    sub = n;
                    break;
                }
                if (comp_(key, n->left->value.first)) {
                    path.push_back({n, Step::left_left});
                    n = n->left->left;
                } else if (comp_(n->left->value.first, key)) {
                    path.push_back({n, Step::left_right});
                    n = n->left->right;
                } else {
                    sub = rotate_right(n);
                    break;
                }
            } else if (comp_(n->value.first, key)) {
                if (!n->right) {
                    sub = n;
                    break;
                }
                if (comp_(n->right->value.first, key)) {
                    path.push_back({n, Step::right_right});
                    n = n->right->right;
                } else if (comp_(key, n->right->value.first)) {
                    path.push_back({n, Step::right_left});
                    n = n->right->left;
                } else {
                    sub = rotate_left(n);
                    break;
                }
            } else {
                sub = n;
                break;
            }
        }

        while (!path.empty()) {
            Frame f = path.back();
            path.pop_back();
            Node* p = f.node;
            switch (f.step) {
            case Step::left_left:
                p->left->left = sub;
                p = rotate_right(p);
                sub = p->left ? rotate_right(p) : p;
                break;
            case Step::left_right:
                p->left->right = sub;
                if (sub) p->left = rotate_left(p->left);
                sub = rotate_right(p);
                break;
            case Step::right_right:
                p->right->right = sub;
                p = rotate_left(p);
                sub = p->right ? rotate_left(p) : p;
                break;
            case Step::right_left:
                p->right->left = sub;
                if (sub) p->right = rotate_right(p->right);
                sub = rotate_left(p);
                break;
            }
        }
        return sub;
    }

    bool keys_equal(const key_type& a, const key_type& b) const {
        return !comp_(a, b) && !comp_(b, a);
    }

    // NaN is not part of the total order on floating point keys
    static void check_key(const key_type& k, const char* op) {
        if constexpr (std::is_floating_point<key_type>::value) {
            if (std::isnan(k)) {
                throw std::invalid_argument(std::string(op) + ": NaN key is not totally ordered");
            }
        } else {
            (void)k;
            (void)op;
        }
    }

    Node* find_node_const(const key_type& key) const {
        Node* x = root_;
        while (x) {
            if (comp_(key, x->value.first)) x = x->left;
            else if (comp_(x->value.first, key)) x = x->right;
            else return x;
        }
        return nullptr;
    }

    static const Node* minimum(const Node* x) {
        while (x->left) x = x->left;
        return x;
    }

    static const Node* maximum(const Node* x) {
        while (x->right) x = x->right;
        return x;
    }

    // node allocation helpers
    template <typename... Args>
    Node* allocate_node(Args&&... args) {
        Node* n = NodeAllocTraits::allocate(node_alloc_, 1);
        try {
            NodeAllocTraits::construct(node_alloc_, n, std::forward<Args>(args)...);
        } catch (...) {
            NodeAllocTraits::deallocate(node_alloc_, n, 1);
            throw;
        }
        return n;
    }

    void deallocate_node(Node* n) noexcept {
        NodeAllocTraits::destroy(node_alloc_, n);
        NodeAllocTraits::deallocate(node_alloc_, n, 1);
    }

    // Frees a subtree without recursion by rotating left children up until the leftmost node is
    // the local root, then releasing it and continuing with its right child.
    void destroy_subtree(Node* n) noexcept {
        while (n) {
            if (n->left) {
                Node* l = n->left;
                n->left = l->right;
                l->right = n;
                n = l;
            } else {
                Node* r = n->right;
                deallocate_node(n);
                n = r;
            }
        }
    }

    // Shape-preserving deep copy using this container's allocator.
    Node* clone_tree(const Node* src) {
        if (!src) return nullptr;
        Node* out = nullptr;
        std::vector<std::pair<const Node*, Node**>> work;
        work.push_back({src, &out});
        try {
            while (!work.empty()) {
                auto item = work.back();
                work.pop_back();
                Node* n = allocate_node(item.first->value);
                *item.second = n;
                if (item.first->left) work.push_back({item.first->left, &n->left});
                if (item.first->right) work.push_back({item.first->right, &n->right});
            }
        } catch (...) {
            destroy_subtree(out);
            throw;
        }
        return out;
    }

    void steal(SplayTreeMap& other) noexcept {
        root_ = other.root_;
        size_ = other.size_;
        rotation_count_ = other.rotation_count_;
        other.root_ = nullptr;
        other.size_ = 0;
        other.rotation_count_ = 0;
    }

    // utility: convert pointer to hex string
    static std::string pointer_to_hex(const void* p) {
        std::ostringstream oss;
        oss << "0x" << std::hex << reinterpret_cast<std::uintptr_t>(p) << std::dec;
        return oss.str();
    }

    // utility: escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u00" << std::hex << (static_cast<int>(c) >> 4) << (static_cast<int>(c) & 0xf) << std::dec;
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    // helper: stream a key or value into string (requires operator<<)
    template <typename V>
    static std::string key_to_string(const V& v) {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }

    // numbers stay bare, everything else is a JSON string
    template <typename V>
    static std::string json_scalar(const V& v) {
        if constexpr (std::is_arithmetic<V>::value && !std::is_same<V, bool>::value && !std::is_same<V, char>::value) {
            return key_to_string(v);
        } else {
            return json_escape_and_quote(key_to_string(v));
        }
    }
};

template <typename Key, typename T, typename Alloc>
void swap(SplayTreeMap<Key, T, Alloc>& a, SplayTreeMap<Key, T, Alloc>& b) noexcept {
    a.swap(b);
}

#endif // SPLAY_TREE_MAP_HPP
