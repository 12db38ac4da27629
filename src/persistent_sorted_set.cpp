#include "persistent_sorted_set.hpp"
#include "debug_log.hpp"
#include "tree_config.hpp"
#include <sstream>
#include <utility>

static std::string keyRepr(const py::object& key) {
    return py::repr(key).cast<std::string>();
}

// PyKeyCompare implementation

int PyKeyCompare::operator()(const py::object& k1, const py::object& k2) const {
    if (cmp_) {
        py::object result = cmp_(k1, k2);
        if (!py::isinstance<py::int_>(result)) {
            throw py::type_error(std::string("cmp must return an int, not ") + Py_TYPE(result.ptr())->tp_name);
        }
        py::int_ zero(0);
        int lt = PyObject_RichCompareBool(result.ptr(), zero.ptr(), Py_LT);
        if (lt == -1) throw py::error_already_set();
        if (lt) return -1;
        int gt = PyObject_RichCompareBool(result.ptr(), zero.ptr(), Py_GT);
        if (gt == -1) throw py::error_already_set();
        return gt ? 1 : 0;
    }

    // Fast path: same object
    if (k1.is(k2)) return 0;

    int eq = PyObject_RichCompareBool(k1.ptr(), k2.ptr(), Py_EQ);
    if (eq == 1) return 0;
    if (eq == -1) throw py::error_already_set();

    int lt = PyObject_RichCompareBool(k1.ptr(), k2.ptr(), Py_LT);
    if (lt == -1) throw py::error_already_set();
    return lt ? -1 : 1;
}

// PersistentSortedSet implementation

PersistentSortedSet::PersistentSortedSet(const py::object& cmp)
    : tree_(PyKeyCompare(cmp), optionsFromConfig()) {}

PersistentSortedSet::PersistentSortedSet(Tree tree)
    : tree_(std::move(tree)) {}

searchtree::TreeOptions PersistentSortedSet::optionsFromConfig() {
    searchtree::TreeConfig config = searchtree::currentConfig();
    searchtree::TreeOptions options;
    options.duplicates = config.duplicates;
    options.validate = config.validate;
    return options;
}

// Core operations

PersistentSortedSet PersistentSortedSet::conj(const py::object& key) const {
    Tree tree = tree_;
    bool inserted = tree.insert(key);
    SEARCHTREE_DEBUG_LOG("PersistentSortedSet::conj",
                         "key=" << keyRepr(key) << (inserted ? " inserted" : " duplicate")
                                << " size=" << tree.size() << " height=" << tree.height());
    return PersistentSortedSet(std::move(tree));
}

PersistentSortedSet PersistentSortedSet::disj(const py::object& key) const {
    Tree tree = tree_;
    if (!tree.remove(key)) {
        // Key wasn't found, share the original root
        SEARCHTREE_DEBUG_LOG("PersistentSortedSet::disj", "key=" << keyRepr(key) << " absent");
        return *this;
    }
    SEARCHTREE_DEBUG_LOG("PersistentSortedSet::disj",
                         "key=" << keyRepr(key) << " removed size=" << tree.size()
                                << " height=" << tree.height());
    return PersistentSortedSet(std::move(tree));
}

bool PersistentSortedSet::contains(const py::object& key) const {
    return tree_.contains(key);
}

py::object PersistentSortedSet::get(const py::object& key, const py::object& default_val) const {
    const py::object* found = tree_.find(key);
    return found ? *found : default_val;
}

// Ordered operations

py::object PersistentSortedSet::first() const {
    return tree_.first();
}

py::object PersistentSortedSet::last() const {
    return tree_.last();
}

py::list PersistentSortedSet::range(const py::object& start, const py::object& end) const {
    py::list result;
    for (const py::object& key : tree_.range(start, end)) {
        result.append(key);
    }
    return result;
}

// Iteration and conversion

SortedSetIterator PersistentSortedSet::iter() const {
    return SortedSetIterator(*this);
}

py::list PersistentSortedSet::list() const {
    py::list result;
    for (const py::object& key : tree_) {
        result.append(key);
    }
    return result;
}

// Equality

bool PersistentSortedSet::operator==(const PersistentSortedSet& other) const {
    if (this == &other) return true;
    if (tree_.root() == other.tree_.root()) return true;
    if (size() != other.size()) return false;

    Tree::const_iterator it1 = tree_.begin();
    Tree::const_iterator it2 = other.tree_.begin();
    for (; it1 != tree_.end(); ++it1, ++it2) {
        int eq = PyObject_RichCompareBool(it1->ptr(), it2->ptr(), Py_EQ);
        if (eq == -1) throw py::error_already_set();
        if (eq != 1) return false;
    }
    return true;
}

// String representation

std::string PersistentSortedSet::repr() const {
    std::ostringstream oss;
    oss << "PersistentSortedSet([";

    size_t count = size();
    size_t i = 0;
    for (const py::object& key : tree_) {
        if (i > 0) oss << ", ";
        oss << keyRepr(key);

        if (i >= 10 && count > 12) {
            oss << ", ... (" << (count - 11) << " more)";
            break;
        }
        i++;
    }

    oss << "])";
    return oss.str();
}

std::string PersistentSortedSet::checkInvariants() const {
    searchtree::InvariantReport report = tree_.checkInvariants();
    return report.ok ? std::string() : report.message;
}

// Factory methods

PersistentSortedSet PersistentSortedSet::fromIterable(const py::object& iterable, const py::object& cmp) {
    PersistentSortedSet empty(cmp);
    if (iterable.is_none()) return empty;

    std::vector<py::object> keys;
    for (auto item : iterable) {
        keys.push_back(py::reinterpret_borrow<py::object>(item));
    }

    const Tree& base = empty.tree_;
    if (searchtree::isStrictlyAscending(keys, base.comparator())) {
        // Sorted unique input: build balanced directly
        SEARCHTREE_DEBUG_LOG("PersistentSortedSet::fromIterable", "bulk build of " << keys.size() << " keys");
        return PersistentSortedSet(Tree::fromSorted(keys, base.comparator(), base.options()));
    }

    Tree tree = base;
    for (const py::object& key : keys) {
        tree.insert(key);
    }
    SEARCHTREE_DEBUG_LOG("PersistentSortedSet::fromIterable",
                         keys.size() << " keys, size=" << tree.size() << " height=" << tree.height());
    return PersistentSortedSet(std::move(tree));
}

PersistentSortedSet PersistentSortedSet::create(const py::args& args) {
    return fromIterable(args, py::none());
}

// SortedSetIterator implementation

SortedSetIterator::SortedSetIterator(const PersistentSortedSet& set)
    : it_(set.tree_.begin()), end_(set.tree_.end()) {}

py::object SortedSetIterator::next() {
    if (it_ == end_) {
        throw py::stop_iteration();
    }
    py::object key = *it_;
    ++it_;
    return key;
}
