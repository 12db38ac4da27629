#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace searchtree {

// Forward declarations
template<typename Key> class AVLNode;

// What insert() does when the key is already present
enum class DuplicatePolicy {
    Replace,  // rebuild the node around the inserted key, children unchanged
    Keep      // return the existing subtree untouched
};

/**
 * ThreeWayCompare - Adapts a strict weak ordering to the int-returning
 * comparator the tree algorithms consume.
 *
 * Any callable int(const Key&, const Key&) returning negative, zero or
 * positive can be used in its place.
 */
template<typename Key, typename Less = std::less<Key>>
struct ThreeWayCompare {
    Less less;

    int operator()(const Key& a, const Key& b) const {
        if (less(a, b)) return -1;
        if (less(b, a)) return 1;
        return 0;
    }
};

/**
 * NodeRef - Owning handle to an immutable, reference counted AVLNode
 *
 * An empty NodeRef is the empty tree (or a missing child). Copying a
 * NodeRef shares the subtree, moving transfers ownership, and the last
 * handle to go away releases the node.
 */
template<typename Key>
class NodeRef {
public:
    NodeRef() noexcept : node_(nullptr) {}

    // Adopts a node; the node's refcount is incremented
    explicit NodeRef(const AVLNode<Key>* node) noexcept : node_(node) {
        if (node_) node_->addRef();
    }

    NodeRef(const NodeRef& other) noexcept : node_(other.node_) {
        if (node_) node_->addRef();
    }

    NodeRef(NodeRef&& other) noexcept : node_(other.node_) {
        other.node_ = nullptr;
    }

    ~NodeRef() {
        if (node_) node_->release();
    }

    NodeRef& operator=(const NodeRef& other) noexcept {
        if (other.node_) other.node_->addRef();
        if (node_) node_->release();
        node_ = other.node_;
        return *this;
    }

    NodeRef& operator=(NodeRef&& other) noexcept {
        if (this != &other) {
            if (node_) node_->release();
            node_ = other.node_;
            other.node_ = nullptr;
        }
        return *this;
    }

    bool empty() const noexcept { return node_ == nullptr; }
    explicit operator bool() const noexcept { return node_ != nullptr; }

    const AVLNode<Key>* get() const noexcept { return node_; }
    const AVLNode<Key>& operator*() const { return *node_; }
    const AVLNode<Key>* operator->() const { return node_; }

    // Identity comparison: same node, not equal contents
    bool operator==(const NodeRef& other) const noexcept { return node_ == other.node_; }
    bool operator!=(const NodeRef& other) const noexcept { return node_ != other.node_; }

private:
    const AVLNode<Key>* node_;
};

/**
 * AVLNode - Immutable node of a persistent AVL tree
 *
 * Height and size are derived from the children at construction and can
 * never go stale, because nothing about a node changes after it is built.
 * Mutating operations build new nodes along one root-to-leaf path and
 * share every other subtree with the previous version.
 *
 * Uses intrusive reference counting for memory management.
 */
template<typename Key>
class AVLNode {
public:
    using Ref = NodeRef<Key>;

    // Leaf node: height 1, size 1
    explicit AVLNode(const Key& key)
        : key_(key), left_(), right_(), height_(1), size_(1), refcount_(0) {}

    AVLNode(const Key& key, Ref left, Ref right)
        : key_(key),
          left_(std::move(left)),
          right_(std::move(right)),
          height_(1 + std::max(heightOf(left_), heightOf(right_))),
          size_(1 + sizeOf(left_) + sizeOf(right_)),
          refcount_(0) {}

    // No copy/move (managed by refcounting)
    AVLNode(const AVLNode&) = delete;
    AVLNode& operator=(const AVLNode&) = delete;

    ~AVLNode() = default;

    static Ref leaf(const Key& key) {
        return Ref(new AVLNode(key));
    }

    static Ref make(const Key& key, Ref left, Ref right) {
        return Ref(new AVLNode(key, std::move(left), std::move(right)));
    }

    // Reference counting
    void addRef() const {
        refcount_.fetch_add(1, std::memory_order_relaxed);
    }

    void release() const {
        if (refcount_.fetch_sub(1, std::memory_order_release) == 1) {
            std::atomic_thread_fence(std::memory_order_acquire);
            delete this;
        }
    }

    uint32_t getRefCount() const {
        return refcount_.load(std::memory_order_relaxed);
    }

    const Key& key() const { return key_; }
    const Ref& left() const { return left_; }
    const Ref& right() const { return right_; }
    bool hasLeft() const { return !left_.empty(); }
    bool hasRight() const { return !right_.empty(); }
    int height() const { return height_; }
    size_t size() const { return size_; }

    // Right subtree height minus left subtree height
    int balanceFactor() const { return heightOf(right_) - heightOf(left_); }

    static int heightOf(const Ref& node) { return node ? node->height_ : 0; }
    static size_t sizeOf(const Ref& node) { return node ? node->size_ : 0; }

private:
    const Key key_;
    const Ref left_;
    const Ref right_;
    const int height_;
    const size_t size_;
    mutable std::atomic<uint32_t> refcount_;
};

// Rotations and rebalancing. Every helper builds new nodes and leaves its
// input untouched.
namespace detail {

/*
 *               Left Rotation
 *
 *        [10]                     (15)
 *       /   \                     /  \
 *      5    (15)      --->     [10]   20
 *           /  \               /  \
 *          12  20             5    12
 */
template<typename Key>
NodeRef<Key> rotateLeft(const AVLNode<Key>& node) {
    const AVLNode<Key>& pivot = *node.right();
    NodeRef<Key> lowered = AVLNode<Key>::make(node.key(), node.left(), pivot.left());
    return AVLNode<Key>::make(pivot.key(), std::move(lowered), pivot.right());
}

/*
 *               Right Rotation
 *
 *        [10]                      (5)
 *       /   \                     /  \
 *     (5)    15       --->       2   [10]
 *    /  \                            /  \
 *   2    7                          7    15
 */
template<typename Key>
NodeRef<Key> rotateRight(const AVLNode<Key>& node) {
    const AVLNode<Key>& pivot = *node.left();
    NodeRef<Key> lowered = AVLNode<Key>::make(node.key(), pivot.right(), node.right());
    return AVLNode<Key>::make(pivot.key(), pivot.left(), std::move(lowered));
}

// Left-heavy by more than one: rotate right, first rotating a right-leaning
// left child to the left.
template<typename Key>
NodeRef<Key> rotateRightIfUnbalanced(NodeRef<Key> root) {
    if (root->balanceFactor() < -1) {
        if (root->left()->balanceFactor() > 0) {
            NodeRef<Key> newLeft = rotateLeft(*root->left());
            root = AVLNode<Key>::make(root->key(), std::move(newLeft), root->right());
        }
        root = rotateRight(*root);
    }
    return root;
}

// Mirror of rotateRightIfUnbalanced
template<typename Key>
NodeRef<Key> rotateLeftIfUnbalanced(NodeRef<Key> root) {
    if (root->balanceFactor() > 1) {
        if (root->right()->balanceFactor() < 0) {
            NodeRef<Key> newRight = rotateRight(*root->right());
            root = AVLNode<Key>::make(root->key(), root->left(), std::move(newRight));
        }
        root = rotateLeft(*root);
    }
    return root;
}

template<typename Key, typename Compare>
NodeRef<Key> insertNode(const NodeRef<Key>& node, const Key& key, const Compare& cmp,
                        DuplicatePolicy policy) {
    using Node = AVLNode<Key>;

    int comparison = cmp(key, node->key());
    if (comparison < 0) {
        if (!node->hasLeft()) {
            // A fresh leaf cannot unbalance this level
            return Node::make(node->key(), Node::leaf(key), node->right());
        }
        NodeRef<Key> newLeft = insertNode(node->left(), key, cmp, policy);
        if (newLeft == node->left()) return node;
        return rotateRightIfUnbalanced(Node::make(node->key(), std::move(newLeft), node->right()));
    }
    if (comparison > 0) {
        if (!node->hasRight()) {
            return Node::make(node->key(), node->left(), Node::leaf(key));
        }
        NodeRef<Key> newRight = insertNode(node->right(), key, cmp, policy);
        if (newRight == node->right()) return node;
        return rotateLeftIfUnbalanced(Node::make(node->key(), node->left(), std::move(newRight)));
    }

    // Duplicate key
    if (policy == DuplicatePolicy::Keep) return node;
    return Node::make(key, node->left(), node->right());
}

// Key to promote into a two-child node being deleted, taken from the
// taller subtree so the delete needs no rotation at this level.
template<typename Key>
const Key& replacementKey(const AVLNode<Key>& node) {
    const AVLNode<Key>* replacement;
    if (node.balanceFactor() > -1) {
        replacement = node.right().get();
        while (replacement->hasLeft()) {
            replacement = replacement->left().get();
        }
    } else {
        replacement = node.left().get();
        while (replacement->hasRight()) {
            replacement = replacement->right().get();
        }
    }
    return replacement->key();
}

template<typename Key, typename Compare>
NodeRef<Key> removeNode(const NodeRef<Key>& node, const Key& key, const Compare& cmp) {
    using Node = AVLNode<Key>;

    int comparison = cmp(key, node->key());
    if (comparison < 0) {
        if (!node->hasLeft()) return node;
        NodeRef<Key> newLeft = removeNode(node->left(), key, cmp);
        if (newLeft == node->left()) return node;
        return rotateLeftIfUnbalanced(Node::make(node->key(), std::move(newLeft), node->right()));
    }
    if (comparison > 0) {
        if (!node->hasRight()) return node;
        NodeRef<Key> newRight = removeNode(node->right(), key, cmp);
        if (newRight == node->right()) return node;
        return rotateRightIfUnbalanced(Node::make(node->key(), node->left(), std::move(newRight)));
    }

    if (node->hasLeft() && node->hasRight()) {
        // The replacement key lives in a subtree that `node` keeps alive
        const Key& replacement = replacementKey(*node);
        NodeRef<Key> reduced = removeNode(node, replacement, cmp);
        return Node::make(replacement, reduced->left(), reduced->right());
    }
    if (node->hasLeft()) return node->left();
    return node->right();
}

template<typename Key, typename Compare>
void collectRange(const AVLNode<Key>& node, const Key& start, const Key& end, const Compare& cmp,
                  std::vector<Key>& result) {
    bool startsBefore = cmp(start, node.key()) <= 0;
    bool endsAfter = cmp(end, node.key()) >= 0;

    if (startsBefore && node.hasLeft()) {
        collectRange(*node.left(), start, end, cmp, result);
    }
    if (startsBefore && endsAfter) {
        result.push_back(node.key());
    }
    if (endsAfter && node.hasRight()) {
        collectRange(*node.right(), start, end, cmp, result);
    }
}

template<typename Key>
void collectInOrder(const AVLNode<Key>& node, std::vector<Key>& result) {
    if (node.hasLeft()) collectInOrder(*node.left(), result);
    result.push_back(node.key());
    if (node.hasRight()) collectInOrder(*node.right(), result);
}

}  // namespace detail

// Core operations. An empty NodeRef is the empty tree; every operation
// returns the root of the resulting version and leaves `root` untouched.

template<typename Key, typename Compare>
NodeRef<Key> insert(const NodeRef<Key>& root, const Key& key, const Compare& cmp,
                    DuplicatePolicy policy = DuplicatePolicy::Replace) {
    if (!root) return AVLNode<Key>::leaf(key);
    return detail::insertNode(root, key, cmp, policy);
}

// Returns `root` itself when the key is absent
template<typename Key, typename Compare>
NodeRef<Key> remove(const NodeRef<Key>& root, const Key& key, const Compare& cmp) {
    if (!root) return root;
    return detail::removeNode(root, key, cmp);
}

template<typename Key, typename Compare>
bool contains(const NodeRef<Key>& root, const Key& key, const Compare& cmp) {
    const AVLNode<Key>* current = root.get();
    while (current) {
        int comparison = cmp(key, current->key());
        if (comparison == 0) return true;
        current = comparison < 0 ? current->left().get() : current->right().get();
    }
    return false;
}

// Stored key equal to `key`, or nullptr
template<typename Key, typename Compare>
const Key* find(const NodeRef<Key>& root, const Key& key, const Compare& cmp) {
    const AVLNode<Key>* current = root.get();
    while (current) {
        int comparison = cmp(key, current->key());
        if (comparison == 0) return &current->key();
        current = comparison < 0 ? current->left().get() : current->right().get();
    }
    return nullptr;
}

template<typename Key>
const Key* findMin(const NodeRef<Key>& root) {
    const AVLNode<Key>* current = root.get();
    if (!current) return nullptr;
    while (current->hasLeft()) {
        current = current->left().get();
    }
    return &current->key();
}

template<typename Key>
const Key* findMax(const NodeRef<Key>& root) {
    const AVLNode<Key>* current = root.get();
    if (!current) return nullptr;
    while (current->hasRight()) {
        current = current->right().get();
    }
    return &current->key();
}

// Keys k with start <= k <= end, ascending
template<typename Key, typename Compare>
std::vector<Key> range(const NodeRef<Key>& root, const Key& start, const Key& end, const Compare& cmp) {
    std::vector<Key> result;
    if (root) detail::collectRange(*root, start, end, cmp, result);
    return result;
}

template<typename Key>
std::vector<Key> traverse(const NodeRef<Key>& root) {
    std::vector<Key> result;
    if (root) {
        result.reserve(root->size());
        detail::collectInOrder(*root, result);
    }
    return result;
}

}  // namespace searchtree
