#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "persistent_sorted_set.hpp"
#include "debug_log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(pysearchtree, m) {
    m.doc() = "Persistent sorted set (immutable AVL tree with structural sharing) implemented in C++";
    m.attr("__version__") = "0.1.0";

    m.def("set_debug_log", &searchtree::openDebugLog,
          py::arg("path"),
          "Write debug records to the given file (truncated); an empty path turns logging off.\n\n"
          "Overrides the SEARCHTREE_DEBUG_LOG environment variable.\n\n"
          "Raises:\n"
          "    RuntimeError: If the file cannot be opened");

    // Expose iterator as Python iterator
    py::class_<SortedSetIterator>(m, "SortedSetIterator")
        .def("__iter__", &SortedSetIterator::iter, py::return_value_policy::reference_internal)
        .def("__next__", &SortedSetIterator::next);

    py::class_<PersistentSortedSet>(m, "PersistentSortedSet")
        .def(py::init([](const py::object& iterable, const py::object& cmp) {
                 return PersistentSortedSet::fromIterable(iterable, cmp);
             }),
             py::arg("iterable") = py::none(), py::arg("cmp") = py::none(),
             "Create a PersistentSortedSet.\n\n"
             "Args:\n"
             "    iterable: Optional keys to add\n"
             "    cmp: Optional cmp(a, b) -> int ordering; defaults to < and ==\n\n"
             "Complexity: O(n) for sorted unique input, O(n log n) otherwise")

        // Core methods
        .def("conj", &PersistentSortedSet::conj,
             py::arg("key"),
             "Add key, returning new set.\n\n"
             "Args:\n"
             "    key: The key (must be ordered by the set's comparison)\n\n"
             "Returns:\n"
             "    A new PersistentSortedSet containing key. Adding a key equal to a\n"
             "    stored one replaces the stored key (SEARCHTREE_DUPLICATES=keep\n"
             "    keeps it instead)\n\n"
             "Complexity: O(log n)")

        .def("disj", &PersistentSortedSet::disj,
             py::arg("key"),
             "Remove key, returning new set.\n\n"
             "Args:\n"
             "    key: The key to remove\n\n"
             "Returns:\n"
             "    A new PersistentSortedSet without key, or this set if key is absent\n\n"
             "Complexity: O(log n)")

        .def("contains", &PersistentSortedSet::contains,
             py::arg("key"),
             "Check if key is in the set.\n\n"
             "Complexity: O(log n)")

        .def("get", &PersistentSortedSet::get,
             py::arg("key"), py::arg("default") = py::none(),
             "Get the stored key equal to key, or default if not found.\n\n"
             "Complexity: O(log n)")

        // Python-friendly aliases
        .def("add", &PersistentSortedSet::conj,
             py::arg("key"),
             "Pythonic alias for conj(). Returns a new set.")

        .def("remove", &PersistentSortedSet::disj,
             py::arg("key"),
             "Pythonic alias for disj(). Returns a new set; absent keys are ignored.")

        .def("discard", &PersistentSortedSet::disj,
             py::arg("key"),
             "Pythonic alias for disj(). Returns a new set.")

        // Ordered operations
        .def("first", &PersistentSortedSet::first,
             "Get the smallest key.\n\n"
             "Raises:\n"
             "    IndexError: If set is empty\n\n"
             "Complexity: O(log n)")

        .def("last", &PersistentSortedSet::last,
             "Get the largest key.\n\n"
             "Raises:\n"
             "    IndexError: If set is empty\n\n"
             "Complexity: O(log n)")

        .def("range", &PersistentSortedSet::range,
             py::arg("start"), py::arg("end"),
             "Get keys in range [start, end].\n\n"
             "Args:\n"
             "    start: Start key (inclusive)\n"
             "    end: End key (inclusive)\n\n"
             "Returns:\n"
             "    Ascending list of keys k with start <= k <= end\n\n"
             "Complexity: O(m + log n) where m is output size")

        .def("height", &PersistentSortedSet::height,
             "Height of the underlying AVL tree (0 when empty).")

        .def("list", &PersistentSortedSet::list,
             "Return list of all keys in ascending order.")

        .def_property_readonly("cmp", &PersistentSortedSet::cmp,
             "The cmp callable ordering this set, or None for natural ordering.")

        .def("_check_invariants", &PersistentSortedSet::checkInvariants,
             "Verify ordering, balance and bookkeeping of every node.\n\n"
             "Returns:\n"
             "    Empty string if all invariants hold, else a description of the\n"
             "    first violation")

        // Python protocols
        .def("__contains__", &PersistentSortedSet::contains,
             py::arg("key"))

        .def("__len__", &PersistentSortedSet::size,
             "Return number of keys in the set.")

        .def("__iter__", &PersistentSortedSet::iter,
             "Iterate over keys in ascending order.")

        .def("__eq__",
             [](const PersistentSortedSet& self, py::object other) -> bool {
                 if (!py::isinstance<PersistentSortedSet>(other)) {
                     return false;
                 }
                 return self == other.cast<const PersistentSortedSet&>();
             },
             py::arg("other"),
             "Check equality with another set: same keys in the same order.")

        .def("__ne__",
             [](const PersistentSortedSet& self, py::object other) -> bool {
                 if (!py::isinstance<PersistentSortedSet>(other)) {
                     return true;
                 }
                 return self != other.cast<const PersistentSortedSet&>();
             },
             py::arg("other"))

        .def("__repr__", &PersistentSortedSet::repr)

        // Factory methods
        .def_static("from_iterable", &PersistentSortedSet::fromIterable,
             py::arg("iterable"), py::arg("cmp") = py::none(),
             "Create a PersistentSortedSet from any iterable.")

        .def_static("create", &PersistentSortedSet::create,
             "Create a PersistentSortedSet from positional arguments.\n\n"
             "Example:\n"
             "    s = PersistentSortedSet.create(3, 1, 2)")

        // Pickle support
        .def(py::pickle(
            [](const PersistentSortedSet& s) { // __getstate__
                return py::make_tuple(s.list(), s.cmp());
            },
            [](py::tuple t) { // __setstate__: (keys, cmp)
                py::object keys = t[0];
                py::object cmp = t[1];
                return PersistentSortedSet::fromIterable(keys, cmp);
            }
        ));
}
