#include "avl_tree.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using searchtree::AVLNode;
using searchtree::AVLTree;
using searchtree::DuplicatePolicy;
using searchtree::TreeOptions;
using IntTree = AVLTree<int>;

IntTree makeTree(const std::vector<int>& keys) {
    IntTree tree;
    for (int key : keys) {
        tree.insert(key);
    }
    return tree;
}

// Ordering that can be reversed after keys were inserted
struct FlippableCompare {
    std::shared_ptr<bool> reversed;

    int operator()(int a, int b) const {
        int result = a < b ? -1 : (a > b ? 1 : 0);
        return *reversed ? -result : result;
    }
};

}  // namespace

TEST(AVLTreeTest, EmptyTree) {
    IntTree tree;
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(0u, tree.size());
    EXPECT_EQ(0, tree.height());
    EXPECT_FALSE(tree.contains(1));
    EXPECT_TRUE(tree.keys().empty());
    EXPECT_TRUE(tree.begin() == tree.end());
    EXPECT_TRUE(tree.checkInvariants().ok);
}

TEST(AVLTreeTest, InsertAndRemoveReportChanges) {
    IntTree tree;
    EXPECT_TRUE(tree.insert(5));
    EXPECT_TRUE(tree.insert(3));
    EXPECT_FALSE(tree.insert(5));
    EXPECT_EQ(2u, tree.size());

    EXPECT_FALSE(tree.remove(4));
    EXPECT_TRUE(tree.remove(5));
    EXPECT_FALSE(tree.remove(5));
    EXPECT_EQ(1u, tree.size());
    EXPECT_EQ((std::vector<int>{3}), tree.keys());
}

TEST(AVLTreeTest, RemoveAbsentKeepsRoot) {
    IntTree tree = makeTree({5, 3, 8, 1, 4, 7, 9});
    const AVLNode<int>* root = tree.root().get();
    EXPECT_FALSE(tree.remove(6));
    EXPECT_EQ(root, tree.root().get());
}

TEST(AVLTreeTest, SizeCountsDistinctKeys) {
    IntTree tree;
    for (int round = 0; round < 3; ++round) {
        for (int key = 0; key < 50; ++key) {
            tree.insert(key * 7 % 50);
        }
    }
    EXPECT_EQ(50u, tree.size());
    EXPECT_TRUE(tree.checkInvariants().ok);
}

TEST(AVLTreeTest, CopyIsSnapshot) {
    IntTree tree = makeTree({5, 3, 8, 1, 4, 7, 9});
    IntTree snapshot = tree;
    EXPECT_EQ(tree.root(), snapshot.root());

    tree.insert(6);
    tree.remove(1);
    tree.remove(5);

    EXPECT_EQ((std::vector<int>{1, 3, 4, 5, 7, 8, 9}), snapshot.keys());
    EXPECT_EQ((std::vector<int>{3, 4, 6, 7, 8, 9}), tree.keys());
    EXPECT_TRUE(snapshot.checkInvariants().ok);
    EXPECT_TRUE(tree.checkInvariants().ok);
}

TEST(AVLTreeTest, IteratorWalksAscending) {
    IntTree tree = makeTree({5, 3, 8, 1, 4, 7, 9});
    std::vector<int> seen;
    for (int key : tree) {
        seen.push_back(key);
    }
    EXPECT_EQ(tree.keys(), seen);

    IntTree::const_iterator it = tree.begin();
    EXPECT_EQ(1, *it++);
    EXPECT_EQ(3, *it);
    ++it;
    EXPECT_EQ(4, *it);
}

TEST(AVLTreeTest, IteratorOutlivesTree) {
    IntTree::const_iterator it;
    IntTree::const_iterator end;
    {
        IntTree tree = makeTree({1, 2, 3, 4, 5});
        it = tree.begin();
        end = tree.end();
        tree.clear();
        EXPECT_TRUE(tree.empty());
    }
    std::vector<int> seen;
    for (; it != end; ++it) {
        seen.push_back(*it);
    }
    EXPECT_EQ((std::vector<int>{1, 2, 3, 4, 5}), seen);
}

TEST(AVLTreeTest, IteratorsOverDifferentVersionsDiffer) {
    IntTree older = makeTree({1, 2, 3, 4, 5, 6, 7});
    IntTree newer = older;
    newer.insert(8);

    // Both walks start on the shared leftmost leaf
    ASSERT_EQ(older.root()->left(), newer.root()->left());
    EXPECT_EQ(*older.begin(), *newer.begin());
    EXPECT_TRUE(older.begin() != newer.begin());
    EXPECT_TRUE(older.begin() == older.begin());
    EXPECT_TRUE(older.end() == newer.end());
}

TEST(AVLTreeTest, FirstAndLast) {
    IntTree tree = makeTree({5, 3, 8, 1, 4, 7, 9});
    EXPECT_EQ(1, tree.first());
    EXPECT_EQ(9, tree.last());

    IntTree empty;
    EXPECT_THROW(empty.first(), std::out_of_range);
    EXPECT_THROW(empty.last(), std::out_of_range);
}

TEST(AVLTreeTest, RangeOverStrings) {
    AVLTree<std::string> tree;
    for (const char* word : {"delta", "alpha", "echo", "charlie", "bravo"}) {
        tree.insert(word);
    }
    EXPECT_EQ((std::vector<std::string>{"bravo", "charlie", "delta"}), tree.range("b", "d~"));
    EXPECT_EQ((std::vector<std::string>{"alpha", "bravo", "charlie", "delta", "echo"}), tree.keys());
    EXPECT_NE(nullptr, tree.find("echo"));
    EXPECT_EQ(nullptr, tree.find("foxtrot"));
}

TEST(AVLTreeTest, FromSortedBuildsBalancedTree) {
    std::vector<int> keys;
    for (int key = 1; key <= 1000; ++key) {
        keys.push_back(key);
    }
    IntTree tree = IntTree::fromSorted(keys);
    EXPECT_EQ(1000u, tree.size());
    EXPECT_EQ(10, tree.height());
    EXPECT_EQ(keys, tree.keys());
    EXPECT_TRUE(tree.checkInvariants().ok);

    // Still a regular tree afterwards
    EXPECT_TRUE(tree.insert(1001));
    EXPECT_TRUE(tree.remove(500));
    EXPECT_TRUE(tree.checkInvariants().ok);

    EXPECT_TRUE(IntTree::fromSorted({}).empty());
}

TEST(AVLTreeTest, FromSortedRejectsUnorderedInput) {
    EXPECT_THROW(IntTree::fromSorted({1, 3, 2}), std::invalid_argument);
    EXPECT_THROW(IntTree::fromSorted({1, 2, 2, 3}), std::invalid_argument);
}

TEST(AVLTreeTest, KeepPolicyLeavesRootInPlace) {
    TreeOptions options;
    options.duplicates = DuplicatePolicy::Keep;
    IntTree tree(searchtree::ThreeWayCompare<int>(), options);
    tree.insert(2);
    tree.insert(1);
    tree.insert(3);

    const AVLNode<int>* root = tree.root().get();
    EXPECT_FALSE(tree.insert(1));
    EXPECT_EQ(root, tree.root().get());

    IntTree replacing = makeTree({2, 1, 3});
    root = replacing.root().get();
    EXPECT_FALSE(replacing.insert(1));
    EXPECT_NE(root, replacing.root().get());
}

TEST(AVLTreeTest, ValidationRejectsInconsistentOrdering) {
    FlippableCompare flippable{std::make_shared<bool>(false)};
    TreeOptions options;
    options.validate = true;
    AVLTree<int, FlippableCompare> tree(flippable, options);
    tree.insert(1);
    tree.insert(2);
    tree.insert(3);

    *flippable.reversed = true;
    const AVLNode<int>* root = tree.root().get();
    EXPECT_THROW(tree.insert(0), std::logic_error);
    EXPECT_EQ(root, tree.root().get());
    EXPECT_EQ(3u, tree.size());
}

TEST(AVLTreeTest, CheckInvariantsReportsViolations) {
    using Node = AVLNode<int>;
    searchtree::ThreeWayCompare<int> cmp;

    auto misordered = Node::make(5, Node::leaf(7), Node::leaf(1));
    searchtree::InvariantReport report = searchtree::checkInvariants(misordered, cmp);
    EXPECT_FALSE(report.ok);
    EXPECT_NE(std::string::npos, report.message.find("ordering"));

    auto deepOrder = Node::make(5, Node::make(2, Node::leaf(1), Node::leaf(6)), Node::leaf(8));
    EXPECT_FALSE(searchtree::checkInvariants(deepOrder, cmp).ok);

    auto chain = Node::make(3, Node::Ref(), Node::make(4, Node::Ref(), Node::leaf(5)));
    report = searchtree::checkInvariants(chain, cmp);
    EXPECT_FALSE(report.ok);
    EXPECT_NE(std::string::npos, report.message.find("balance factor 2"));
}

TEST(AVLTreeTest, DrainToEmpty) {
    IntTree tree;
    for (int key = 0; key < 256; ++key) {
        tree.insert(key);
    }
    EXPECT_EQ(9, tree.height());
    for (int key = 0; key < 256; key += 2) {
        ASSERT_TRUE(tree.remove(key));
        ASSERT_TRUE(tree.checkInvariants().ok) << key;
    }
    for (int key = 255; key > 0; key -= 2) {
        ASSERT_TRUE(tree.remove(key));
        ASSERT_TRUE(tree.checkInvariants().ok) << key;
    }
    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(0, tree.height());
}
