#include "tiktoken_encoder.hpp"

#include <stdexcept>

#include <pybind11/embed.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace tokbench {

namespace {

void ensure_interpreter() {
  static py::scoped_interpreter guard{};
}

class TiktokenEncoder final : public Encoder {
 public:
  explicit TiktokenEncoder(const std::string& encoding) : name_(encoding) {
    ensure_interpreter();
    try {
      auto tiktoken = py::module_::import("tiktoken");
      encoding_ = tiktoken.attr("get_encoding")(encoding);
      encode_ = encoding_.attr("encode");
    } catch (const py::error_already_set& e) {
      throw std::runtime_error("failed to load tiktoken encoding " + encoding + " (pip install tiktoken): " +
                               e.what());
    }
  }

  [[nodiscard]] std::vector<TokenId> Encode(std::string_view text) const override {
    py::str arg(text.data(), text.size());
    return encode_(arg).cast<std::vector<TokenId>>();
  }

  [[nodiscard]] std::string_view Name() const override { return name_; }

 private:
  std::string name_;
  py::object encoding_;
  py::object encode_;
};

}  // namespace

std::unique_ptr<Encoder> MakeTiktokenEncoder(const std::string& encoding) {
  return std::make_unique<TiktokenEncoder>(encoding);
}

}  // namespace tokbench
