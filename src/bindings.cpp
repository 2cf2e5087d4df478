#include "interview/config.hpp"
#include "interview/errors.hpp"
#include "interview/interview_engine.hpp"
#include "interview/storage.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      json_obj[py::cast<std::string>(item.first)] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw interview::ValidationError("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_unsigned()) {
    return py::int_(json_value.get<unsigned long long>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  py::dict dict;
  for (const auto& entry : json_value.items()) {
    dict[py::str(entry.key())] = json_to_py(entry.value());
  }
  return dict;
}

class PyInterviewService {
public:
  explicit PyInterviewService(const std::string& config_file)
      : settings_(interview::EngineSettings::from_env()), env_(settings_.cache_size) {
    interview::load_config_file(config_file.empty() ? settings_.config_file : config_file, env_,
                                registry_);
    storage_ = std::make_unique<interview::InMemoryStorage>(registry_, settings_.state_ttl);
    engine_ = interview::make_engine(registry_, *storage_);
  }

  py::object start_interview(const std::string& interview_id, py::object request_obj) {
    auto request = interview::bridge::start_request_from_json(py_to_json(request_obj));
    return json_to_py(interview::bridge::to_json(engine_->start_interview(interview_id, request)));
  }

  py::object update_interview(const std::string& state_key, py::object responses_obj) {
    std::optional<nlohmann::json> responses;
    if (!responses_obj.is_none()) {
      responses = py_to_json(responses_obj);
    }
    return json_to_py(interview::bridge::to_json(engine_->update_interview(state_key, responses)));
  }

  py::object get_completed_interview(const std::string& state_key) {
    auto state = engine_->get_completed_interview(state_key);
    if (!state) {
      return py::none();
    }
    return json_to_py(interview::bridge::to_json(*state));
  }

  std::vector<std::string> interview_ids() const { return engine_->interview_ids(); }

private:
  interview::EngineSettings settings_;
  interview::Environment env_;
  interview::InterviewRegistry registry_;
  std::unique_ptr<interview::InMemoryStorage> storage_;
  std::unique_ptr<interview::InterviewEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_interviewcore, m) {
  // Translators run newest first, so the base class is registered first.
  py::register_exception<interview::InterviewError>(m, "InterviewError", PyExc_RuntimeError);
  py::register_exception<interview::ValidationError>(m, "ValidationError", PyExc_ValueError);
  py::register_exception<interview::NotFoundError>(m, "NotFoundError", PyExc_KeyError);

  py::class_<PyInterviewService>(m, "InterviewService")
      .def(py::init<std::string>(), py::arg("config_file") = std::string())
      .def("start_interview", &PyInterviewService::start_interview, py::arg("interview_id"),
           py::arg("request") = py::none())
      .def("update_interview", &PyInterviewService::update_interview, py::arg("state"),
           py::arg("responses") = py::none())
      .def("get_completed_interview", &PyInterviewService::get_completed_interview,
           py::arg("state"))
      .def("interview_ids", &PyInterviewService::interview_ids);
}
