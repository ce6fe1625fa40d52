#include "resources.hpp"

#include <simdjson.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace kube::model {
    namespace {
        using simdjson::ondemand::field;
        using simdjson::ondemand::value;

        std::string read_string(value& v) {
            const std::string_view sv = v.get_string();
            return std::string(sv);
        }

        int64_t read_int(value& v) {
            const int64_t n = v.get_int64();
            return n;
        }

        void read_string_map(value& v, std::map<std::string, std::string>& out) {
            for (field f : v.get_object()) {
                const std::string key(std::string_view(f.unescaped_key()));
                value& item = f.value();
                if (item.is_null()) {
                    continue;
                }
                out[key] = read_string(item);
            }
        }

        void read_string_list(value& v, std::vector<std::string>& out) {
            for (value item : v.get_array()) {
                out.push_back(read_string(item));
            }
        }

        template <typename T>
        void read_list(value& v, std::vector<T>& out) {
            for (value item : v.get_array()) {
                T element{};
                decode(item, element);
                out.push_back(std::move(element));
            }
        }

        void put_if(nlohmann::json& j, const char* key, const std::string& s) {
            if (!s.empty()) {
                j[key] = s;
            }
        }

        template <typename T>
        void put_if(nlohmann::json& j, const char* key, const std::vector<T>& v) {
            if (!v.empty()) {
                j[key] = v;
            }
        }

        void put_if(nlohmann::json& j, const char* key, const std::map<std::string, std::string>& m) {
            if (!m.empty()) {
                j[key] = m;
            }
        }

        void put_if(nlohmann::json& j, const char* key, const std::optional<int64_t>& n) {
            if (n) {
                j[key] = *n;
            }
        }

        void put_if(nlohmann::json& j, const char* key, int64_t n) {
            if (n != 0) {
                j[key] = n;
            }
        }

        void put_if(nlohmann::json& j, const char* key, const nlohmann::json& nested) {
            if (!nested.empty()) {
                j[key] = nested;
            }
        }
    }  // namespace

    //
    // Encoding
    //

    void to_json(nlohmann::json& j, const ObjectMeta& m) {
        j = nlohmann::json::object();
        put_if(j, "name", m.name_);
        put_if(j, "namespace", m.namespace_);
        put_if(j, "uid", m.uid_);
        put_if(j, "resourceVersion", m.resource_version_);
        put_if(j, "labels", m.labels_);
        put_if(j, "annotations", m.annotations_);
    }

    void to_json(nlohmann::json& j, const EnvVar& e) {
        j = nlohmann::json::object();
        j["name"] = e.name_;
        put_if(j, "value", e.value_);
    }

    void to_json(nlohmann::json& j, const Container& c) {
        j = nlohmann::json::object();
        j["name"] = c.name_;
        put_if(j, "image", c.image_);
        put_if(j, "command", c.command_);
        put_if(j, "args", c.args_);
        put_if(j, "env", c.env_);
    }

    void to_json(nlohmann::json& j, const PodSpec& s) {
        j = nlohmann::json::object();
        put_if(j, "containers", s.containers_);
        put_if(j, "restartPolicy", s.restart_policy_);
        put_if(j, "serviceAccountName", s.service_account_name_);
        put_if(j, "nodeSelector", s.node_selector_);
    }

    void to_json(nlohmann::json& j, const PodStatus& s) {
        j = nlohmann::json::object();
        put_if(j, "phase", s.phase_);
        put_if(j, "reason", s.reason_);
        put_if(j, "message", s.message_);
        put_if(j, "startTime", s.start_time_);
    }

    void to_json(nlohmann::json& j, const Pod& p) {
        j = nlohmann::json::object();
        j["metadata"] = p.metadata_;
        put_if(j, "spec", nlohmann::json(p.spec_));
        put_if(j, "status", nlohmann::json(p.status_));
    }

    void to_json(nlohmann::json& j, const PodTemplateSpec& t) {
        j = nlohmann::json::object();
        put_if(j, "metadata", nlohmann::json(t.metadata_));
        put_if(j, "spec", nlohmann::json(t.spec_));
    }

    void to_json(nlohmann::json& j, const JobSpec& s) {
        j = nlohmann::json::object();
        put_if(j, "parallelism", s.parallelism_);
        put_if(j, "completions", s.completions_);
        put_if(j, "activeDeadlineSeconds", s.active_deadline_seconds_);
        put_if(j, "template", nlohmann::json(s.template_));
    }

    void to_json(nlohmann::json& j, const JobStatus& s) {
        j = nlohmann::json::object();
        put_if(j, "active", s.active_);
        put_if(j, "succeeded", s.succeeded_);
        put_if(j, "failed", s.failed_);
        put_if(j, "startTime", s.start_time_);
        put_if(j, "completionTime", s.completion_time_);
    }

    void to_json(nlohmann::json& j, const Job& job) {
        j = nlohmann::json::object();
        j["metadata"] = job.metadata_;
        put_if(j, "spec", nlohmann::json(job.spec_));
        put_if(j, "status", nlohmann::json(job.status_));
    }

    void to_json(nlohmann::json& j, const Secret& s) {
        j = nlohmann::json::object();
        j["metadata"] = s.metadata_;
        put_if(j, "type", s.type_);
        put_if(j, "data", s.data_);
    }

    //
    // Decoding
    //

    void decode(value& v, ObjectMeta& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "name") {
                out.name_ = read_string(item);
            } else if (key == "namespace") {
                out.namespace_ = read_string(item);
            } else if (key == "uid") {
                out.uid_ = read_string(item);
            } else if (key == "resourceVersion") {
                out.resource_version_ = read_string(item);
            } else if (key == "labels") {
                read_string_map(item, out.labels_);
            } else if (key == "annotations") {
                read_string_map(item, out.annotations_);
            }
        }
    }

    void decode(value& v, EnvVar& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "name") {
                out.name_ = read_string(item);
            } else if (key == "value") {
                out.value_ = read_string(item);
            }
        }
    }

    void decode(value& v, Container& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "name") {
                out.name_ = read_string(item);
            } else if (key == "image") {
                out.image_ = read_string(item);
            } else if (key == "command") {
                read_string_list(item, out.command_);
            } else if (key == "args") {
                read_string_list(item, out.args_);
            } else if (key == "env") {
                read_list(item, out.env_);
            }
        }
    }

    void decode(value& v, PodSpec& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "containers") {
                read_list(item, out.containers_);
            } else if (key == "restartPolicy") {
                out.restart_policy_ = read_string(item);
            } else if (key == "serviceAccountName") {
                out.service_account_name_ = read_string(item);
            } else if (key == "nodeSelector") {
                read_string_map(item, out.node_selector_);
            }
        }
    }

    void decode(value& v, PodStatus& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "phase") {
                out.phase_ = read_string(item);
            } else if (key == "reason") {
                out.reason_ = read_string(item);
            } else if (key == "message") {
                out.message_ = read_string(item);
            } else if (key == "startTime") {
                out.start_time_ = read_string(item);
            }
        }
    }

    void decode(value& v, Pod& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "metadata") {
                decode(item, out.metadata_);
            } else if (key == "spec") {
                decode(item, out.spec_);
            } else if (key == "status") {
                decode(item, out.status_);
            }
        }
    }

    void decode(value& v, PodTemplateSpec& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "metadata") {
                decode(item, out.metadata_);
            } else if (key == "spec") {
                decode(item, out.spec_);
            }
        }
    }

    void decode(value& v, JobSpec& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "parallelism") {
                out.parallelism_ = read_int(item);
            } else if (key == "completions") {
                out.completions_ = read_int(item);
            } else if (key == "activeDeadlineSeconds") {
                out.active_deadline_seconds_ = read_int(item);
            } else if (key == "template") {
                decode(item, out.template_);
            }
        }
    }

    void decode(value& v, JobStatus& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "active") {
                out.active_ = read_int(item);
            } else if (key == "succeeded") {
                out.succeeded_ = read_int(item);
            } else if (key == "failed") {
                out.failed_ = read_int(item);
            } else if (key == "startTime") {
                out.start_time_ = read_string(item);
            } else if (key == "completionTime") {
                out.completion_time_ = read_string(item);
            }
        }
    }

    void decode(value& v, Job& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "metadata") {
                decode(item, out.metadata_);
            } else if (key == "spec") {
                decode(item, out.spec_);
            } else if (key == "status") {
                decode(item, out.status_);
            }
        }
    }

    void decode(value& v, Secret& out) {
        for (field f : v.get_object()) {
            const std::string_view key = f.unescaped_key();
            value& item = f.value();
            if (item.is_null()) {
                continue;
            }
            if (key == "metadata") {
                decode(item, out.metadata_);
            } else if (key == "type") {
                out.type_ = read_string(item);
            } else if (key == "data") {
                read_string_map(item, out.data_);
            }
        }
    }
}  // namespace kube::model
