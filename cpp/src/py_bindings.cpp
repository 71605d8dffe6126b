#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include <memory>
#include <string>
#include <vector>

#include "../include/action.hpp"
#include "../include/dev_debug.hpp"
#include "../include/edit_applier.hpp"
#include "../include/message_parser.hpp"
#include "../include/output_sanitizer.hpp"
#include "../include/posix_shell_channel.hpp"
#include "../include/read_set.hpp"
#include "../include/sentinel_decoder.hpp"
#include "../include/shell_session.hpp"
#include "../include/tag_scanner.hpp"
#include "../include/validation_gate.hpp"

namespace py = pybind11;
using namespace actionstream::core;

namespace actionstream {
namespace pybridge {

namespace {

py::dict event_to_dict(const ActionEvent& ev) {
    py::dict d;
    d["kind"] = to_string(ev.kind);
    d["action_id"] = ev.actionId;
    d["text"] = ev.text;
    if (ev.action) d["action"] = py::cast(*ev.action);
    else d["action"] = py::none();
    return d;
}

py::list events_to_list(const std::vector<ActionEvent>& events) {
    py::list out;
    for (const auto& ev : events) out.append(event_to_dict(ev));
    return out;
}

py::dict verdict_to_dict(const SubmissionVerdict& v) {
    py::dict d;
    d["accepted"] = v.accepted;
    if (v.accepted) return d;
    d["error_code"] = v.errorCode;
    d["remediation"] = v.remediation;
    d["message"] = v.message;
    if (!v.missingPaths.empty()) d["missing_paths"] = v.missingPaths;
    if (!v.path.empty()) d["path"] = v.path;
    if (!v.invalidEdits.empty()) d["invalid_edits"] = v.invalidEdits;
    return d;
}

py::dict token_to_dict(const SentinelToken& t) {
    py::dict d;
    d["kind"] = to_string(t.kind);
    if (t.kind == SentinelToken::Kind::Sentinel) {
        d["name"] = t.name;
        if (t.value) d["value"] = *t.value;
        else d["value"] = py::none();
    } else {
        d["text"] = py::bytes(t.text);
    }
    return d;
}

ActionCallback wrap_callback(py::object fn) {
    if (fn.is_none()) return {};
    return [fn = std::move(fn)](const ActionCallbackData& data) {
        py::gil_scoped_acquire gil;
        fn(data.messageId, event_to_dict(data.event));
    };
}

// File map owned by Python (dict path -> content), consulted under the GIL.
class DictFileStore final : public FileStore {
public:
    DictFileStore(py::dict files, std::string workDir)
        : files_(std::move(files)), workDir_(std::move(workDir)) {}

    std::optional<std::string> getContents(const std::string& path) const override {
        py::gil_scoped_acquire gil;
        for (auto item : files_) {
            const auto key = normalize_path(py::cast<std::string>(item.first), workDir_);
            if (key == path) {
                if (item.second.is_none()) return std::string{};
                return py::cast<std::string>(item.second);
            }
        }
        return std::nullopt;
    }

private:
    py::dict files_;
    std::string workDir_;
};

// Keeps the gate's referenced collaborators alive as long as the gate.
struct GateHolder {
    std::shared_ptr<DictFileStore> files;
    std::shared_ptr<ReadSet> reads;
    std::shared_ptr<UpdatedSet> updates;
    ValidationGate gate;

    GateHolder(py::dict fileMap, std::shared_ptr<ReadSet> r, std::shared_ptr<UpdatedSet> u, std::string workDir)
        : files(std::make_shared<DictFileStore>(std::move(fileMap), workDir))
        , reads(std::move(r))
        , updates(std::move(u))
        , gate(*files, *reads, *updates, PathPolicy{workDir, default_read_exemption}) {}
};

py::dict result_to_dict(const CommandResult& r) {
    py::dict d;
    d["output"] = r.output;
    d["exit_code"] = r.exitCode == kExitCodeUnknown ? py::object(py::none()) : py::object(py::int_(r.exitCode));
    d["status"] = to_string(r.status);
    d["generation"] = r.generation;
    d["sentinel"] = r.sentinel;
    d["execution_time"] = r.executionTime;
    d["success"] = r.success();
    d["partial_tail"] = r.partialTail;
    return d;
}

} // namespace

void bind_module(py::module_& m) {
    m.doc() = "Streaming action markup parser, read-before-write gate and shell session engine";

    py::class_<Edit>(m, "Edit")
        .def(py::init<>())
        .def(py::init([](std::string before, std::string after) { return Edit{std::move(before), std::move(after)}; }),
             py::arg("before"), py::arg("after"))
        .def_readwrite("before", &Edit::before)
        .def_readwrite("after", &Edit::after);

    py::class_<ActionTag>(m, "ActionTag")
        .def_readonly("id", &ActionTag::id)
        .def_readonly("implicitly_closed", &ActionTag::implicitlyClosed)
        .def_property_readonly("type", [](const ActionTag& a) { return std::string(to_string(a.type())); })
        .def_property_readonly("path", [](const ActionTag& a) { return a.path(); })
        .def_property_readonly("content", [](const ActionTag& a) -> py::object {
            if (auto* f = std::get_if<FileAction>(&a.payload)) return py::str(f->content);
            return py::none();
        })
        .def_property_readonly("command", [](const ActionTag& a) -> py::object {
            if (auto* s = std::get_if<ShellAction>(&a.payload)) return py::str(s->command);
            return py::none();
        })
        .def_property_readonly("start", [](const ActionTag& a) {
            auto* s = std::get_if<ShellAction>(&a.payload);
            return s != nullptr && s->start;
        })
        .def_property_readonly("edits", [](const ActionTag& a) {
            if (auto* mod = std::get_if<ModifyAction>(&a.payload)) return mod->edits;
            return std::vector<Edit>{};
        })
        .def_static("file", [](std::string path, std::string content) {
            return ActionTag{"", FileAction{std::move(path), std::move(content)}, false};
        }, py::arg("path"), py::arg("content") = "")
        .def_static("modify", [](std::string path, std::vector<Edit> edits) {
            return ActionTag{"", ModifyAction{std::move(path), std::move(edits)}, false};
        }, py::arg("path"), py::arg("edits"))
        .def_static("shell", [](std::string command, bool start) {
            return ActionTag{"", ShellAction{std::move(command), start}, false};
        }, py::arg("command"), py::arg("start") = false);

    py::class_<ScannerOptions>(m, "ScannerOptions")
        .def(py::init<>())
        .def_readwrite("tag_name", &ScannerOptions::tagName)
        .def_readwrite("path_attributes", &ScannerOptions::pathAttributes)
        .def_readwrite("max_open_tag_length", &ScannerOptions::maxOpenTagLength)
        .def_readwrite("id_prefix", &ScannerOptions::idPrefix);

    py::class_<TagScanner>(m, "TagScanner")
        .def(py::init<ScannerOptions>(), py::arg("options") = ScannerOptions{})
        .def("feed", [](TagScanner& s, std::string_view chunk) { return events_to_list(s.feed(chunk)); })
        .def("finalize", [](TagScanner& s) { return events_to_list(s.finalize()); })
        .def("reset", &TagScanner::reset)
        .def_property_readonly("state", [](const TagScanner& s) { return std::string(to_string(s.state())); })
        .def_property_readonly("inside_action", &TagScanner::insideAction)
        .def_property_readonly("actions_opened", &TagScanner::actionsOpened);

    py::class_<MessageParser>(m, "MessageParser")
        .def(py::init([](py::object onOpen, py::object onStream, py::object onClose, ScannerOptions opts) {
                 ParserCallbacks cbs;
                 cbs.onActionOpen = wrap_callback(std::move(onOpen));
                 cbs.onActionStream = wrap_callback(std::move(onStream));
                 cbs.onActionClose = wrap_callback(std::move(onClose));
                 return std::make_unique<MessageParser>(std::move(cbs), std::move(opts));
             }),
             py::arg("on_action_open") = py::none(), py::arg("on_action_stream") = py::none(),
             py::arg("on_action_close") = py::none(), py::arg("options") = ScannerOptions{})
        .def("feed", &MessageParser::feed, py::arg("message_id"), py::arg("chunk"))
        .def("parse", &MessageParser::parse, py::arg("message_id"), py::arg("full_text"))
        .def("finalize", &MessageParser::finalize, py::arg("message_id"))
        .def("reset", &MessageParser::reset)
        .def_property_readonly("message_count", &MessageParser::messageCount)
        .def_static("placeholder", &MessageParser::placeholder);

    py::class_<SentinelDecoder>(m, "SentinelDecoder")
        .def(py::init<int>(), py::arg("opcode") = kDefaultSentinelOpcode)
        .def("feed", [](SentinelDecoder& d, py::bytes chunk) {
            py::list out;
            for (const auto& t : d.feed(std::string(chunk))) out.append(token_to_dict(t));
            return out;
        })
        .def("finalize", [](SentinelDecoder& d) {
            py::list out;
            for (const auto& t : d.finalize()) out.append(token_to_dict(t));
            return out;
        })
        .def("reset", &SentinelDecoder::reset)
        .def_property_readonly("has_partial", &SentinelDecoder::hasPartial);

    m.def("encode_sentinel", [](std::string_view name, std::optional<std::string> value, int opcode) {
        std::optional<std::string_view> v;
        if (value) v = *value;
        return py::bytes(encode_sentinel(name, v, opcode));
    }, py::arg("name"), py::arg("value") = py::none(), py::arg("opcode") = kDefaultSentinelOpcode);

    m.def("sanitize", &sanitize, py::arg("text"));
    m.def("strip_escape_sequences", &strip_escape_sequences, py::arg("text"));
    m.def("normalize_path", &normalize_path, py::arg("path"), py::arg("work_dir") = std::string(kDefaultWorkDir));

    m.def("apply_edits", [](std::string_view content, const std::vector<Edit>& edits) {
        EditResult r = apply_edits(content, edits);
        py::dict d;
        d["success"] = r.success;
        d["content"] = r.content;
        d["applied"] = r.applied;
        d["failed_index"] = r.failedIndex ? py::object(py::int_(*r.failedIndex)) : py::object(py::none());
        return d;
    }, py::arg("content"), py::arg("edits"));

    py::class_<ReadSet, std::shared_ptr<ReadSet>>(m, "ReadSet")
        .def(py::init<std::string>(), py::arg("work_dir") = std::string(kDefaultWorkDir))
        .def("record_read", &ReadSet::recordRead)
        .def("__contains__", &ReadSet::contains)
        .def("__len__", &ReadSet::size)
        .def_property_readonly("paths", &ReadSet::paths);

    py::class_<UpdatedSet, std::shared_ptr<UpdatedSet>>(m, "UpdatedSet")
        .def(py::init<std::string>(), py::arg("work_dir") = std::string(kDefaultWorkDir))
        .def("record_update", &UpdatedSet::recordUpdate)
        .def("__contains__", &UpdatedSet::contains)
        .def("__len__", &UpdatedSet::size)
        .def_property_readonly("paths", &UpdatedSet::paths);

    py::class_<GateHolder>(m, "ValidationGate")
        .def(py::init<py::dict, std::shared_ptr<ReadSet>, std::shared_ptr<UpdatedSet>, std::string>(),
             py::arg("files"), py::arg("reads"), py::arg("updates"),
             py::arg("work_dir") = std::string(kDefaultWorkDir))
        .def("requires_read", [](const GateHolder& g, std::string_view p) { return g.gate.requiresRead(p); })
        .def("check", [](const GateHolder& g, const std::vector<ActionTag>& a) { return verdict_to_dict(g.gate.check(a)); })
        .def("check_submission", [](const GateHolder& g, const std::vector<ActionTag>& a) {
            return verdict_to_dict(g.gate.checkSubmission(a));
        })
        .def("check_shell_command", [](const GateHolder& g, std::string_view c) {
            return verdict_to_dict(g.gate.checkShellCommand(c));
        });

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("shell_path", &Config::shellPath)
        .def_readwrite("shell_args", &Config::shellArgs)
        .def_readwrite("working_directory", &Config::workingDirectory)
        .def_readwrite("environment", &Config::environment)
        .def_readwrite("sentinel_opcode", &Config::sentinelOpcode)
        .def_readwrite("exit_sentinel", &Config::exitSentinel)
        .def_readwrite("begin_sentinel", &Config::beginSentinel)
        .def_readwrite("ready_sentinel", &Config::readySentinel)
        .def_readwrite("timeout_seconds", &Config::timeoutSeconds)
        .def_readwrite("poll_interval_ms", &Config::pollIntervalMs)
        .def_readwrite("idle_nudge", &Config::idleNudge)
        .def_readwrite("idle_nudge_ms", &Config::idleNudgeMs)
        .def_readwrite("max_output_bytes", &Config::maxOutputBytes)
        .def_readwrite("truncated_output_bytes", &Config::truncatedOutputBytes)
        .def_readwrite("sanitize_output", &Config::sanitizeOutput);

    py::class_<ShellSession, std::shared_ptr<ShellSession>>(m, "ShellSession")
        .def(py::init([](std::string id, Config cfg) {
                 auto channel = std::make_shared<PosixShellChannel>(cfg);
                 return std::make_shared<ShellSession>(std::move(id), std::move(channel), std::move(cfg));
             }),
             py::arg("session_id"), py::arg("config") = Config{})
        .def("start", &ShellSession::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &ShellSession::stop, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("is_started", &ShellSession::isStarted)
        .def("execute", [](ShellSession& s, const std::string& cmd, std::function<void()> onAbort) {
            CommandResult r;
            {
                py::gil_scoped_release nogil;
                r = s.executeCommand(cmd, std::move(onAbort));
            }
            return result_to_dict(r);
        }, py::arg("command"), py::arg("on_abort") = nullptr)
        .def("execute_async", [](ShellSession& s, std::string cmd, std::function<void()> onAbort,
                                 std::function<void(py::dict)> callback) {
            ShellSession::ResultCallback cb;
            if (callback) {
                cb = [callback = std::move(callback)](const CommandResult& r) {
                    py::gil_scoped_acquire gil;
                    callback(result_to_dict(r));
                };
            }
            py::gil_scoped_release nogil;
            // Completion is reported through the callback only.
            (void)s.executeAsync(std::move(cmd), std::move(onAbort), std::move(cb));
        }, py::arg("command"), py::arg("on_abort") = nullptr, py::arg("callback") = nullptr)
        .def("wait_for_completion", [](ShellSession& s, const std::string& name) {
            CommandResult r;
            {
                py::gil_scoped_release nogil;
                r = s.waitForCompletion(name);
            }
            return result_to_dict(r);
        }, py::arg("name"))
        .def("abort", &ShellSession::abort, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("state", [](const ShellSession& s) { return std::string(to_string(s.state())); })
        .def_property_readonly("generation", &ShellSession::generation)
        .def_property_readonly("id", &ShellSession::id)
        .def("set_output_listener", [](ShellSession& s, std::function<void(std::string, bool)> fn) {
            ShellSession::OutputListener listener;
            if (fn) {
                listener = [fn = std::move(fn)](std::string_view inc, bool reset) {
                    py::gil_scoped_acquire gil;
                    fn(std::string(inc), reset);
                };
            }
            // A worker delivering output may be waiting for the GIL.
            py::gil_scoped_release nogil;
            s.setOutputListener(std::move(listener));
        }, py::arg("listener"));
}

} // namespace pybridge
} // namespace actionstream

PYBIND11_MODULE(_actionstream, m) {
    ASTREAM_DBG("PY", "module init");
    actionstream::pybridge::bind_module(m);
}
