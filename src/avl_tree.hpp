#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "avl_node.hpp"

namespace searchtree {

struct TreeOptions {
    DuplicatePolicy duplicates = DuplicatePolicy::Replace;
    bool validate = false;  // check invariants before publishing each new root
};

struct InvariantReport {
    bool ok = true;
    std::string message;
};

namespace detail {

// Recomputes the height of `node`, checking ordering against the open
// bounds (low, high), balance, and the stored height/size.
template<typename Key, typename Compare>
int checkNode(const AVLNode<Key>& node, const Key* low, const Key* high, const Compare& cmp,
              InvariantReport& report) {
    if (low && cmp(*low, node.key()) >= 0) {
        report.ok = false;
        report.message = "ordering violated: key not after its lower bound";
        return 0;
    }
    if (high && cmp(node.key(), *high) >= 0) {
        report.ok = false;
        report.message = "ordering violated: key not before its upper bound";
        return 0;
    }

    int leftHeight = node.hasLeft() ? checkNode(*node.left(), low, &node.key(), cmp, report) : 0;
    if (!report.ok) return 0;
    int rightHeight = node.hasRight() ? checkNode(*node.right(), &node.key(), high, cmp, report) : 0;
    if (!report.ok) return 0;

    int height = 1 + std::max(leftHeight, rightHeight);
    size_t size = 1 + AVLNode<Key>::sizeOf(node.left()) + AVLNode<Key>::sizeOf(node.right());
    if (node.height() != height) {
        std::ostringstream oss;
        oss << "stale height: stored " << node.height() << ", actual " << height;
        report.ok = false;
        report.message = oss.str();
    } else if (node.size() != size) {
        std::ostringstream oss;
        oss << "stale size: stored " << node.size() << ", actual " << size;
        report.ok = false;
        report.message = oss.str();
    } else if (rightHeight - leftHeight < -1 || rightHeight - leftHeight > 1) {
        std::ostringstream oss;
        oss << "balance factor " << (rightHeight - leftHeight) << " out of range";
        report.ok = false;
        report.message = oss.str();
    }
    return height;
}

template<typename Key>
NodeRef<Key> buildBalanced(const std::vector<Key>& keys, size_t begin, size_t end) {
    if (begin >= end) return NodeRef<Key>();
    size_t mid = begin + (end - begin) / 2;
    NodeRef<Key> left = buildBalanced(keys, begin, mid);
    NodeRef<Key> right = buildBalanced(keys, mid + 1, end);
    return AVLNode<Key>::make(keys[mid], std::move(left), std::move(right));
}

}  // namespace detail

template<typename Key, typename Compare>
InvariantReport checkInvariants(const NodeRef<Key>& root, const Compare& cmp) {
    InvariantReport report;
    if (root) detail::checkNode<Key, Compare>(*root, nullptr, nullptr, cmp, report);
    return report;
}

template<typename Key, typename Compare>
bool isStrictlyAscending(const std::vector<Key>& keys, const Compare& cmp) {
    for (size_t i = 1; i < keys.size(); ++i) {
        if (cmp(keys[i - 1], keys[i]) >= 0) return false;
    }
    return true;
}

/**
 * AVLTree - Holder of the current version of a persistent AVL set
 *
 * Owns one (possibly empty) root reference and the comparator, forwards
 * every operation into the node algorithms, and replaces its root with the
 * returned one. Copying an AVLTree is O(1): the copy is a snapshot that
 * shares all nodes and is unaffected by later changes to the original.
 *
 * Not safe for concurrent mutation; snapshots may be read from any thread.
 */
template<typename Key, typename Compare = ThreeWayCompare<Key>>
class AVLTree {
public:
    using Node = AVLNode<Key>;
    using Ref = NodeRef<Key>;

    /**
     * In-order iterator with an explicit stack of pending ancestors.
     *
     * Holds a reference to the version it walks, so it stays valid when the
     * tree it came from is modified or destroyed.
     */
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Key;
        using difference_type = std::ptrdiff_t;
        using pointer = const Key*;
        using reference = const Key&;

        const_iterator() : root_(), stack_() {}

        explicit const_iterator(const Ref& root) : root_(root), stack_() {
            pushLeft(root_.get());
        }

        reference operator*() const { return stack_.back()->key(); }
        pointer operator->() const { return &stack_.back()->key(); }

        const_iterator& operator++() {
            const Node* node = stack_.back();
            stack_.pop_back();
            pushLeft(node->right().get());
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++*this;
            return previous;
        }

        // Exhausted iterators compare equal regardless of version; otherwise
        // both must walk the same version and stand on the same node
        bool operator==(const const_iterator& other) const {
            if (stack_.empty() || other.stack_.empty()) return stack_.empty() == other.stack_.empty();
            return root_ == other.root_ && stack_.back() == other.stack_.back();
        }
        bool operator!=(const const_iterator& other) const { return !(*this == other); }

    private:
        Ref root_;
        std::vector<const Node*> stack_;

        void pushLeft(const Node* node) {
            while (node) {
                stack_.push_back(node);
                node = node->left().get();
            }
        }
    };

    AVLTree() : root_(), cmp_(), options_() {}

    explicit AVLTree(Compare cmp, TreeOptions options = TreeOptions())
        : root_(), cmp_(std::move(cmp)), options_(options) {}

    AVLTree(Ref root, Compare cmp, TreeOptions options)
        : root_(std::move(root)), cmp_(std::move(cmp)), options_(options) {}

    // Balanced tree from strictly ascending keys, built bottom-up
    static AVLTree fromSorted(const std::vector<Key>& keys, Compare cmp = Compare(),
                              TreeOptions options = TreeOptions()) {
        if (!isStrictlyAscending(keys, cmp)) {
            throw std::invalid_argument("fromSorted: keys are not strictly ascending");
        }
        return AVLTree(detail::buildBalanced(keys, 0, keys.size()), std::move(cmp), options);
    }

    // True when the key was not present before
    bool insert(const Key& key) {
        size_t before = size();
        publish(searchtree::insert(root_, key, cmp_, options_.duplicates), "insert");
        return size() != before;
    }

    // True when the key was present
    bool remove(const Key& key) {
        Ref newRoot = searchtree::remove(root_, key, cmp_);
        if (newRoot == root_) return false;
        publish(std::move(newRoot), "remove");
        return true;
    }

    void clear() { root_ = Ref(); }

    bool contains(const Key& key) const {
        return searchtree::contains(root_, key, cmp_);
    }

    const Key* find(const Key& key) const {
        return searchtree::find(root_, key, cmp_);
    }

    std::vector<Key> range(const Key& start, const Key& end) const {
        return searchtree::range(root_, start, end, cmp_);
    }

    std::vector<Key> keys() const {
        return searchtree::traverse(root_);
    }

    const Key& first() const {
        const Key* key = findMin(root_);
        if (!key) throw std::out_of_range("first() called on empty tree");
        return *key;
    }

    const Key& last() const {
        const Key* key = findMax(root_);
        if (!key) throw std::out_of_range("last() called on empty tree");
        return *key;
    }

    size_t size() const { return Node::sizeOf(root_); }
    int height() const { return Node::heightOf(root_); }
    bool empty() const { return root_.empty(); }

    const Ref& root() const { return root_; }
    const Compare& comparator() const { return cmp_; }
    const TreeOptions& options() const { return options_; }

    InvariantReport checkInvariants() const {
        return searchtree::checkInvariants(root_, cmp_);
    }

    const_iterator begin() const { return const_iterator(root_); }
    const_iterator end() const { return const_iterator(); }

private:
    Ref root_;
    Compare cmp_;
    TreeOptions options_;

    void publish(Ref newRoot, const char* operation) {
        if (options_.validate) {
            InvariantReport report = searchtree::checkInvariants(newRoot, cmp_);
            if (!report.ok) {
                throw std::logic_error(std::string(operation) + ": " + report.message);
            }
        }
        root_ = std::move(newRoot);
    }
};

}  // namespace searchtree
