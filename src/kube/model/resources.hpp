#ifndef KUBE_CLIENT_RESOURCES_HPP
#define KUBE_CLIENT_RESOURCES_HPP

#include <simdjson.h>

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "model.hpp"

namespace kube::model {
    struct ObjectMeta {
        std::string name_;
        std::string namespace_;
        std::string uid_;
        std::string resource_version_;
        Labels labels_;
        std::map<std::string, std::string> annotations_;

        bool operator==(const ObjectMeta&) const = default;
    };

    struct EnvVar {
        std::string name_;
        std::string value_;

        bool operator==(const EnvVar&) const = default;
    };

    struct Container {
        std::string name_;
        std::string image_;
        std::vector<std::string> command_;
        std::vector<std::string> args_;
        std::vector<EnvVar> env_;

        bool operator==(const Container&) const = default;
    };

    struct PodSpec {
        std::vector<Container> containers_;
        std::string restart_policy_;
        std::string service_account_name_;
        std::map<std::string, std::string> node_selector_;

        bool operator==(const PodSpec&) const = default;
    };

    struct PodStatus {
        std::string phase_;
        std::string reason_;
        std::string message_;
        std::string start_time_;

        bool operator==(const PodStatus&) const = default;
    };

    struct Pod {
        ObjectMeta metadata_;
        PodSpec spec_;
        PodStatus status_;

        bool operator==(const Pod&) const = default;
    };

    struct PodTemplateSpec {
        ObjectMeta metadata_;
        PodSpec spec_;

        bool operator==(const PodTemplateSpec&) const = default;
    };

    struct JobSpec {
        std::optional<int64_t> parallelism_;
        std::optional<int64_t> completions_;
        std::optional<int64_t> active_deadline_seconds_;
        PodTemplateSpec template_;

        bool operator==(const JobSpec&) const = default;
    };

    struct JobStatus {
        int64_t active_{};
        int64_t succeeded_{};
        int64_t failed_{};
        std::string start_time_;
        std::string completion_time_;

        bool operator==(const JobStatus&) const = default;
    };

    struct Job {
        ObjectMeta metadata_;
        JobSpec spec_;
        JobStatus status_;

        bool operator==(const Job&) const = default;
    };

    struct Secret {
        ObjectMeta metadata_;
        std::string type_;
        // base64-encoded values, as the API serves them
        std::map<std::string, std::string> data_;

        bool operator==(const Secret&) const = default;
    };

    // Envelope of every list endpoint.
    template <typename T>
    struct List {
        std::vector<T> items_;
    };

    // Encoders omit empty fields so a round trip through the server is lossless.
    void to_json(nlohmann::json& j, const ObjectMeta& m);
    void to_json(nlohmann::json& j, const EnvVar& e);
    void to_json(nlohmann::json& j, const Container& c);
    void to_json(nlohmann::json& j, const PodSpec& s);
    void to_json(nlohmann::json& j, const PodStatus& s);
    void to_json(nlohmann::json& j, const Pod& p);
    void to_json(nlohmann::json& j, const PodTemplateSpec& t);
    void to_json(nlohmann::json& j, const JobSpec& s);
    void to_json(nlohmann::json& j, const JobStatus& s);
    void to_json(nlohmann::json& j, const Job& job);
    void to_json(nlohmann::json& j, const Secret& s);

    // Decoders skip unknown fields and nulls, and throw simdjson::simdjson_error on a
    // type mismatch.
    void decode(simdjson::ondemand::value& v, ObjectMeta& out);
    void decode(simdjson::ondemand::value& v, EnvVar& out);
    void decode(simdjson::ondemand::value& v, Container& out);
    void decode(simdjson::ondemand::value& v, PodSpec& out);
    void decode(simdjson::ondemand::value& v, PodStatus& out);
    void decode(simdjson::ondemand::value& v, Pod& out);
    void decode(simdjson::ondemand::value& v, PodTemplateSpec& out);
    void decode(simdjson::ondemand::value& v, JobSpec& out);
    void decode(simdjson::ondemand::value& v, JobStatus& out);
    void decode(simdjson::ondemand::value& v, Job& out);
    void decode(simdjson::ondemand::value& v, Secret& out);

    template <typename T>
    void decode(simdjson::ondemand::value& v, List<T>& out) {
        for (simdjson::ondemand::field field : v.get_object()) {
            const std::string_view key = field.unescaped_key();
            simdjson::ondemand::value& value = field.value();
            if (key != "items" || value.is_null()) {
                continue;
            }
            for (simdjson::ondemand::value item : value.get_array()) {
                T element{};
                decode(item, element);
                out.items_.push_back(std::move(element));
            }
        }
    }
}  // namespace kube::model

#endif
