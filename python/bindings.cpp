#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <stdexcept>
#include <string>

#include "tokbench/compare.hpp"
#include "tokbench/corpus.hpp"
#include "tokbench/report.hpp"
#include "tokbench/result.hpp"
#include "tokbench/runner.hpp"
#include "tokbench/size.hpp"

namespace py = pybind11;
using namespace tokbench;

PYBIND11_MODULE(pytokbench, m) {
  m.def("parse_size", [](const std::string& text) {
    std::uint64_t out = 0;
    if (!ParseSize(text, out)) {
      throw std::invalid_argument("invalid size: " + text);
    }
    return out;
  });
  m.def("generate_corpus", [](std::size_t size_bytes, std::uint64_t seed) { return GenerateCorpus(size_bytes, seed); },
        py::arg("size_bytes"), py::arg("seed") = kDefaultCorpusSeed);
  m.def("model_for_encoding", [](const std::string& encoding) { return std::string(ModelForEncoding(encoding)); });

  py::class_<BenchmarkResult>(m, "BenchmarkResult")
      .def(py::init<>())
      .def_readwrite("name", &BenchmarkResult::name)
      .def_readwrite("encoding", &BenchmarkResult::encoding)
      .def_readwrite("input_bytes", &BenchmarkResult::input_bytes)
      .def_readwrite("iterations", &BenchmarkResult::iterations)
      .def_readwrite("tokens", &BenchmarkResult::tokens)
      .def_readwrite("times_ns", &BenchmarkResult::times_ns)
      .def_property_readonly("min_ns", &BenchmarkResult::MinNs)
      .def_property_readonly("max_ns", &BenchmarkResult::MaxNs)
      .def_property_readonly("mean_ns", &BenchmarkResult::MeanNs)
      .def_property_readonly("p50_ns", &BenchmarkResult::P50Ns)
      .def_property_readonly("p95_ns", &BenchmarkResult::P95Ns)
      .def_property_readonly("p99_ns", &BenchmarkResult::P99Ns)
      .def_property_readonly("throughput_mbps", &BenchmarkResult::ThroughputMbps);

  py::enum_<Verdict>(m, "Verdict")
      .value("FASTER", Verdict::kFaster)
      .value("SLOWER", Verdict::kSlower)
      .value("COMPARABLE", Verdict::kComparable)
      .value("INDETERMINATE", Verdict::kIndeterminate);

  py::class_<Comparison>(m, "Comparison")
      .def_readonly("reference_name", &Comparison::reference_name)
      .def_readonly("candidate_name", &Comparison::candidate_name)
      .def_readonly("ratio", &Comparison::ratio)
      .def_readonly("verdict", &Comparison::verdict)
      .def_readonly("token_parity", &Comparison::token_parity)
      .def_readonly("token_diff", &Comparison::token_diff)
      .def("describe", &DescribeVerdict);

  m.def("compare", &Compare, py::arg("reference"), py::arg("candidate"));

  py::class_<RunConfig>(m, "RunConfig")
      .def(py::init<>())
      .def_readwrite("encoding", &RunConfig::encoding)
      .def_readwrite("iterations", &RunConfig::iterations)
      .def_readwrite("warmup", &RunConfig::warmup);

  py::class_<ProcessRunner>(m, "ProcessRunner")
      .def(py::init<std::string, std::string>(), py::arg("binary_path"), py::arg("name") = "candidate")
      .def("run", &ProcessRunner::Run, py::arg("text"), py::arg("config"));

  py::class_<RunMeta>(m, "RunMeta")
      .def(py::init<>())
      .def_readwrite("input_size", &RunMeta::input_size)
      .def_readwrite("input_bytes", &RunMeta::input_bytes)
      .def_readwrite("encoding", &RunMeta::encoding)
      .def_readwrite("iterations", &RunMeta::iterations)
      .def_readwrite("warmup", &RunMeta::warmup)
      .def_readwrite("seed", &RunMeta::seed);

  m.def("format_table", &FormatTable);
  m.def("format_comparison_summary", &FormatComparisonSummary);
  m.def("format_json", &FormatJson);
}
