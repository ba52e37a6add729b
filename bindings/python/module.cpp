#include "wordmatch/boundary.h"
#include "wordmatch/confusables.h"
#include "wordmatch/normalizer.h"
#include "wordmatch/sentence.h"
#include "wordmatch/io_json.h"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

using wordmatch::Boundary;
using wordmatch::ConfusableTable;
using wordmatch::Normalizer;
using wordmatch::Sentence;

namespace {

void set_checked_list(Sentence& sentence, const std::vector<bool>& values) {
    if (values.size() != sentence.length()) {
        throw py::value_error("checked must have " + std::to_string(sentence.length()) +
                              " entries, got " + std::to_string(values.size()));
    }
    sentence.checked() = values;
}

} // namespace

PYBIND11_MODULE(wordmatch_py, m) {
    m.doc() = "Python bindings for the wordmatch normalizer and boundary scanner";

    py::enum_<Boundary>(m, "Boundary")
        .value("Start", Boundary::Start)
        .value("Word", Boundary::Word)
        .value("End", Boundary::End)
        .value("Mixed", Boundary::Mixed)
        .value("NoContent", Boundary::NoContent);

    m.def("is_word", &wordmatch::is_word, py::arg("boundary"),
          "Whether the boundary belongs to a word");

    py::class_<ConfusableTable, std::shared_ptr<ConfusableTable>>(m, "ConfusableTable")
        .def(py::init<>())
        .def_static("load", &ConfusableTable::load, py::arg("path"),
                    "Load a JSON confusables table from disk")
        .def_static("from_json", &ConfusableTable::from_json, py::arg("text"),
                    "Parse a JSON confusables table")
        .def("__len__", &ConfusableTable::size);

    py::class_<Normalizer>(m, "Normalizer")
        .def(py::init<>())
        .def(py::init([](std::shared_ptr<ConfusableTable> table) {
                 return Normalizer(std::move(table));
             }),
             py::arg("table"))
        .def("normalize", &Normalizer::normalize, py::arg("text"),
             "Replace confusables and lowercase");

    py::class_<Sentence>(m, "Sentence")
        .def(py::init<const std::string&>(), py::arg("text"),
             "Lowercase only; pass a Normalizer with a table to fold homoglyphs")
        .def(py::init<const std::string&, const Normalizer&>(), py::arg("text"), py::arg("normalizer"))
        .def_property_readonly("length", &Sentence::length)
        .def("__len__", &Sentence::length)
        .def("to_string", &Sentence::to_string)
        .def("__str__", &Sentence::to_string)
        .def_property_readonly("boundaries", [](const Sentence& s) { return s.boundaries(); })
        .def_property("checked",
                      [](const Sentence& s) { return s.checked(); },
                      &set_checked_list)
        .def("set_checked", &Sentence::set_checked, py::arg("index"), py::arg("value") = true)
        .def("to_json", [](const Sentence& s, int indent) {
                 return wordmatch::dump_sentence(s, false, indent);
             },
             py::arg("indent") = -1);
}
