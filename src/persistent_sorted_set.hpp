#ifndef PERSISTENT_SORTED_SET_HPP
#define PERSISTENT_SORTED_SET_HPP

#include <pybind11/pybind11.h>
#include <string>
#include <vector>
#include "avl_tree.hpp"

namespace py = pybind11;

// Forward declarations
class PersistentSortedSet;
class SortedSetIterator;

// PyKeyCompare - Three-way comparison of Python keys.
// Uses Python's rich comparison unless a cmp(a, b) -> int callable is given.
class PyKeyCompare {
public:
    PyKeyCompare() : cmp_() {}
    explicit PyKeyCompare(const py::object& cmp) : cmp_(cmp.is_none() ? py::object() : cmp) {}

    int operator()(const py::object& k1, const py::object& k2) const;

    // The user supplied callable, or None
    py::object callable() const {
        if (cmp_) return cmp_;
        return py::none();
    }

private:
    py::object cmp_;
};

// PersistentSortedSet - Immutable sorted set backed by a persistent AVL tree
class PersistentSortedSet {
    friend class SortedSetIterator;

public:
    using Tree = searchtree::AVLTree<py::object, PyKeyCompare>;

    // Constructors
    explicit PersistentSortedSet(const py::object& cmp);
    explicit PersistentSortedSet(Tree tree);

    // Core operations (functional API)
    PersistentSortedSet conj(const py::object& key) const;
    PersistentSortedSet disj(const py::object& key) const;
    bool contains(const py::object& key) const;
    py::object get(const py::object& key, const py::object& default_val) const;

    // Ordered operations
    py::object first() const;
    py::object last() const;
    py::list range(const py::object& start, const py::object& end) const;

    // Size and iteration
    size_t size() const { return tree_.size(); }
    int height() const { return tree_.height(); }
    SortedSetIterator iter() const;
    py::list list() const;

    // Equality
    bool operator==(const PersistentSortedSet& other) const;
    bool operator!=(const PersistentSortedSet& other) const { return !(*this == other); }

    // String representation
    std::string repr() const;

    py::object cmp() const { return tree_.comparator().callable(); }

    // Empty string when every invariant holds, else the first violation
    std::string checkInvariants() const;

    // Factory methods
    static PersistentSortedSet fromIterable(const py::object& iterable, const py::object& cmp);
    static PersistentSortedSet create(const py::args& args);

private:
    Tree tree_;

    static searchtree::TreeOptions optionsFromConfig();
};

// SortedSetIterator - Ascending iteration over a snapshot of the set
class SortedSetIterator {
public:
    explicit SortedSetIterator(const PersistentSortedSet& set);

    SortedSetIterator& iter() { return *this; }
    py::object next();

private:
    PersistentSortedSet::Tree::const_iterator it_;
    PersistentSortedSet::Tree::const_iterator end_;
};

#endif // PERSISTENT_SORTED_SET_HPP
