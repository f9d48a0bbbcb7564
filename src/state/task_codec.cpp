/**
 * @file task_codec.cpp
 * @brief TOML encoding and decoding of tasks using toml++.
 * @author Dimitris Kafetzis
 */

#include "state/task_codec.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>

namespace node_agent {

namespace {

// ─────────────────────────────────────────────
// Field readers
// ─────────────────────────────────────────────

Error malformed(std::string_view where, std::string_view what) {
    return Error{ErrorKind::Configuration, std::string(where) + ": " + std::string(what)};
}

Result<std::string> require_string(const toml::table& tbl, std::string_view key,
                                   std::string_view where) {
    auto value = tbl[key].value<std::string>();
    if (!value || value->empty()) {
        return malformed(where, "missing required string '" + std::string(key) + "'");
    }
    return *value;
}

std::string read_string(const toml::table& tbl, std::string_view key, std::string fallback = {}) {
    return tbl[key].value_or(std::move(fallback));
}

template <typename T>
T read_uint(const toml::table& tbl, std::string_view key, T fallback) {
    auto value = tbl[key].value<int64_t>();
    if (!value || *value < 0) return fallback;
    return static_cast<T>(*value);
}

template <typename Enum, typename Parser>
Result<Enum> read_enum(const toml::table& tbl, std::string_view key, Enum fallback,
                       Parser parse, std::string_view where) {
    auto text = tbl[key].value<std::string>();
    if (!text) return fallback;
    if (auto parsed = parse(*text)) return *parsed;
    return malformed(where, "invalid value '" + *text + "' for '" + std::string(key) + "'");
}

std::optional<Timestamp> read_timestamp(const toml::table& tbl, std::string_view key) {
    auto ms = tbl[key].value<int64_t>();
    if (!ms) return std::nullopt;
    return Timestamp{std::chrono::milliseconds{*ms}};
}

std::vector<uint16_t> read_ports(const toml::table& tbl, std::string_view key) {
    std::vector<uint16_t> ports;
    if (const auto* arr = tbl[key].as_array()) {
        for (const auto& elem : *arr) {
            if (auto port = elem.value<int64_t>(); port && *port > 0 && *port <= 65535) {
                ports.push_back(static_cast<uint16_t>(*port));
            }
        }
    }
    return ports;
}

std::vector<std::string> read_strings(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> values;
    if (const auto* arr = tbl[key].as_array()) {
        for (const auto& elem : *arr) {
            if (auto text = elem.value<std::string>()) values.push_back(*text);
        }
    }
    return values;
}

/// Calls @p visit for every table in the array-of-tables @p key.
template <typename F>
Result<void> for_each_table(const toml::table& tbl, std::string_view key, F&& visit) {
    const auto* arr = tbl[key].as_array();
    if (arr == nullptr) return {};
    for (const auto& elem : *arr) {
        const auto* entry = elem.as_table();
        if (entry == nullptr) {
            return Error{ErrorKind::Configuration,
                         "'" + std::string(key) + "' must be an array of tables"};
        }
        auto result = visit(*entry);
        if (!result) return result.error();
    }
    return {};
}

// ─────────────────────────────────────────────
// Field writers
// ─────────────────────────────────────────────

toml::array write_ports(const std::vector<uint16_t>& ports) {
    toml::array arr;
    for (auto port : ports) arr.push_back(static_cast<int64_t>(port));
    return arr;
}

toml::array write_strings(const std::vector<std::string>& values) {
    toml::array arr;
    for (const auto& value : values) arr.push_back(value);
    return arr;
}

void write_timestamp(toml::table& tbl, std::string_view key, const std::optional<Timestamp>& at) {
    if (!at) return;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at->time_since_epoch());
    tbl.insert(key, static_cast<int64_t>(ms.count()));
}

// ─────────────────────────────────────────────
// Definitions
// ─────────────────────────────────────────────

toml::table encode_container_definition(const ContainerDefinition& def) {
    toml::table tbl;
    tbl.insert("name", def.name);
    tbl.insert("image", def.image);
    tbl.insert("kind", std::string(to_string(def.kind)));
    tbl.insert("essential", def.essential);
    tbl.insert("cpu_units", static_cast<int64_t>(def.cpu_units));
    tbl.insert("memory_mb", static_cast<int64_t>(def.memory_mb));
    if (!def.command.empty()) tbl.insert("command", write_strings(def.command));
    if (def.stop_timeout) tbl.insert("stop_timeout_ms", static_cast<int64_t>(def.stop_timeout->count()));
    if (!def.managed_agents.empty()) tbl.insert("managed_agents", write_strings(def.managed_agents));

    if (!def.depends_on.empty()) {
        toml::array deps;
        for (const auto& dep : def.depends_on) {
            deps.push_back(toml::table{
                {"container", dep.container_name},
                {"condition", std::string(to_string(dep.condition))},
            });
        }
        tbl.insert("depends_on", std::move(deps));
    }
    if (!def.port_bindings.empty()) {
        toml::array bindings;
        for (const auto& binding : def.port_bindings) {
            bindings.push_back(toml::table{
                {"container_port", static_cast<int64_t>(binding.container_port)},
                {"host_port", static_cast<int64_t>(binding.host_port)},
                {"protocol", binding.protocol},
            });
        }
        tbl.insert("port_bindings", std::move(bindings));
    }
    return tbl;
}

Result<ContainerDefinition> decode_container_definition(const toml::table& tbl,
                                                        const std::string& task_arn) {
    const std::string where = "task " + task_arn + " container";
    auto name = require_string(tbl, "name", where);
    if (!name) return name.error();
    auto image = require_string(tbl, "image", where + " " + *name);
    if (!image) return image.error();

    ContainerDefinition def;
    def.name = *name;
    def.image = *image;

    auto kind = read_enum(tbl, "kind", ContainerKind::Normal,
                          [](std::string_view text) { return parse_container_kind(text); },
                          where + " " + def.name);
    if (!kind) return kind.error();
    def.kind = *kind;

    def.essential = tbl["essential"].value_or(true);
    def.cpu_units = read_uint(tbl, "cpu_units", uint32_t{0});
    def.memory_mb = read_uint(tbl, "memory_mb", uint64_t{0});
    def.command = read_strings(tbl, "command");
    def.managed_agents = read_strings(tbl, "managed_agents");
    if (auto stop_timeout = tbl["stop_timeout_ms"].value<int64_t>(); stop_timeout && *stop_timeout >= 0) {
        def.stop_timeout = Duration{*stop_timeout};
    }

    auto deps = for_each_table(tbl, "depends_on", [&](const toml::table& entry) -> Result<void> {
        auto dep_name = require_string(entry, "container", where + " " + def.name + " depends_on");
        if (!dep_name) return dep_name.error();
        auto condition = read_enum(entry, "condition", DependencyCondition::Start,
                                   [](std::string_view text) { return parse_dependency_condition(text); },
                                   where + " " + def.name + " depends_on");
        if (!condition) return condition.error();
        def.depends_on.push_back(DependsOn{.container_name = *dep_name, .condition = *condition});
        return {};
    });
    if (!deps) return deps.error();

    auto ports = for_each_table(tbl, "port_bindings", [&](const toml::table& entry) -> Result<void> {
        const auto container_port = read_uint(entry, "container_port", uint32_t{0});
        const auto host_port = read_uint(entry, "host_port", uint32_t{0});
        if (container_port > 65535 || host_port > 65535) {
            return malformed(where + " " + def.name, "port out of range");
        }
        def.port_bindings.push_back(PortBinding{
            .container_port = static_cast<uint16_t>(container_port),
            .host_port = static_cast<uint16_t>(host_port),
            .protocol = read_string(entry, "protocol", "tcp"),
        });
        return {};
    });
    if (!ports) return ports.error();

    return def;
}

toml::table encode_task_definition(const TaskDefinition& def) {
    toml::table tbl;
    tbl.insert("arn", def.arn);
    tbl.insert("family", def.family);
    tbl.insert("version", def.version);
    tbl.insert("launch_type", def.launch_type);
    tbl.insert("desired_status", std::string(to_string(def.desired_status)));
    tbl.insert("is_internal", def.is_internal);
    tbl.insert("cpu_units", static_cast<int64_t>(def.cpu_units));
    tbl.insert("memory_mb", static_cast<int64_t>(def.memory_mb));

    toml::array containers;
    for (const auto& container : def.containers) {
        containers.push_back(encode_container_definition(container));
    }
    tbl.insert("containers", std::move(containers));

    if (!def.resources.empty()) {
        toml::array resources;
        for (const auto& resource : def.resources) {
            resources.push_back(toml::table{
                {"name", resource.name},
                {"kind", std::string(to_string(resource.kind))},
            });
        }
        tbl.insert("resources", std::move(resources));
    }
    if (!def.attachments.empty()) {
        toml::array attachments;
        for (const auto& attachment : def.attachments) {
            attachments.push_back(toml::table{
                {"arn", attachment.arn},
                {"kind", attachment.kind},
            });
        }
        tbl.insert("attachments", std::move(attachments));
    }
    return tbl;
}

Result<TaskDefinition> decode_task_definition(const toml::table& tbl) {
    auto arn = require_string(tbl, "arn", "task");
    if (!arn) return arn.error();
    const std::string where = "task " + *arn;

    TaskDefinition def;
    def.arn = *arn;
    def.family = read_string(tbl, "family");
    def.version = read_string(tbl, "version");
    def.launch_type = read_string(tbl, "launch_type", "EC2");
    def.is_internal = tbl["is_internal"].value_or(false);
    def.cpu_units = read_uint(tbl, "cpu_units", uint32_t{0});
    def.memory_mb = read_uint(tbl, "memory_mb", uint64_t{0});

    auto desired = read_enum(tbl, "desired_status", TaskStatus::Running,
                             [](std::string_view text) { return parse_task_status(text); }, where);
    if (!desired) return desired.error();
    def.desired_status = *desired;

    auto containers = for_each_table(tbl, "containers", [&](const toml::table& entry) -> Result<void> {
        auto container = decode_container_definition(entry, def.arn);
        if (!container) return container.error();
        def.containers.push_back(std::move(*container));
        return {};
    });
    if (!containers) return containers.error();
    if (def.containers.empty()) return malformed(where, "task has no containers");

    auto resources = for_each_table(tbl, "resources", [&](const toml::table& entry) -> Result<void> {
        auto name = require_string(entry, "name", where + " resource");
        if (!name) return name.error();
        auto kind = read_enum(entry, "kind", TaskResourceKind::Volume,
                              [](std::string_view text) { return parse_task_resource_kind(text); },
                              where + " resource " + *name);
        if (!kind) return kind.error();
        def.resources.push_back(TaskResource{.name = *name, .kind = *kind});
        return {};
    });
    if (!resources) return resources.error();

    auto attachments = for_each_table(tbl, "attachments", [&](const toml::table& entry) -> Result<void> {
        auto attachment_arn = require_string(entry, "arn", where + " attachment");
        if (!attachment_arn) return attachment_arn.error();
        def.attachments.push_back(Attachment{
            .arn = *attachment_arn,
            .kind = read_string(entry, "kind", "eni"),
        });
        return {};
    });
    if (!attachments) return attachments.error();

    return def;
}

// ─────────────────────────────────────────────
// Runtime state
// ─────────────────────────────────────────────

toml::table encode_container_state(const ContainerState& state) {
    toml::table tbl;
    tbl.insert("known_status", std::string(to_string(state.known_status)));
    tbl.insert("desired_status", std::string(to_string(state.desired_status)));
    tbl.insert("sent_status", std::string(to_string(state.sent_status)));
    if (state.exit_code) tbl.insert("exit_code", static_cast<int64_t>(*state.exit_code));
    tbl.insert("health", std::string(to_string(state.health)));
    tbl.insert("runtime_id", state.runtime_id);
    tbl.insert("image_digest", state.image_digest);
    tbl.insert("applying_error", state.applying_error);

    toml::array agents;
    for (const auto& agent : state.managed_agents) {
        agents.push_back(toml::table{
            {"name", agent.name},
            {"status", std::string(to_string(agent.status))},
            {"sent_status", std::string(to_string(agent.sent_status))},
            {"reason", agent.reason},
        });
    }
    if (!agents.empty()) tbl.insert("managed_agents", std::move(agents));
    return tbl;
}

std::optional<ManagedAgentStatus> parse_agent_status(std::string_view text) {
    return parse_managed_agent_status(text);
}

Result<ContainerState> decode_container_state(const toml::table& tbl, std::string_view where) {
    ContainerState state;
    auto container_status = [](std::string_view text) { return parse_container_status(text); };

    auto known = read_enum(tbl, "known_status", ContainerStatus::None, container_status, where);
    if (!known) return known.error();
    auto desired = read_enum(tbl, "desired_status", ContainerStatus::Running, container_status, where);
    if (!desired) return desired.error();
    auto sent = read_enum(tbl, "sent_status", ContainerStatus::None, container_status, where);
    if (!sent) return sent.error();
    auto health = read_enum(tbl, "health", HealthStatus::Unknown,
                            [](std::string_view text) { return parse_health_status(text); }, where);
    if (!health) return health.error();

    state.known_status = *known;
    state.desired_status = *desired;
    state.sent_status = *sent;
    state.health = *health;
    if (auto code = tbl["exit_code"].value<int64_t>()) state.exit_code = static_cast<int>(*code);
    state.runtime_id = read_string(tbl, "runtime_id");
    state.image_digest = read_string(tbl, "image_digest");
    state.applying_error = read_string(tbl, "applying_error");

    auto agents = for_each_table(tbl, "managed_agents", [&](const toml::table& entry) -> Result<void> {
        auto name = require_string(entry, "name", where);
        if (!name) return name.error();
        auto status = read_enum(entry, "status", ManagedAgentStatus::Pending, parse_agent_status, where);
        if (!status) return status.error();
        auto agent_sent = read_enum(entry, "sent_status", ManagedAgentStatus::Pending,
                                    parse_agent_status, where);
        if (!agent_sent) return agent_sent.error();
        state.managed_agents.push_back(ManagedAgent{
            .name = *name,
            .status = *status,
            .sent_status = *agent_sent,
            .reason = read_string(entry, "reason"),
        });
        return {};
    });
    if (!agents) return agents.error();
    return state;
}

toml::table encode_task_state(const TaskState& state) {
    toml::table tbl;
    tbl.insert("known_status", std::string(to_string(state.known_status)));
    tbl.insert("desired_status", std::string(to_string(state.desired_status)));
    tbl.insert("sent_status", std::string(to_string(state.sent_status)));
    tbl.insert("stop_reason", state.stop_reason);
    write_timestamp(tbl, "pull_started_at", state.pull_started_at);
    write_timestamp(tbl, "pull_stopped_at", state.pull_stopped_at);
    write_timestamp(tbl, "execution_stopped_at", state.execution_stopped_at);

    toml::array resources;
    for (const auto& resource : state.resources) {
        resources.push_back(toml::table{
            {"name", resource.name},
            {"status", std::string(to_string(resource.status))},
        });
    }
    if (!resources.empty()) tbl.insert("resources", std::move(resources));

    toml::array attachments;
    for (const auto& attachment : state.attachments) {
        attachments.push_back(toml::table{
            {"arn", attachment.arn},
            {"status", std::string(to_string(attachment.status))},
            {"sent_status", std::string(to_string(attachment.sent_status))},
        });
    }
    if (!attachments.empty()) tbl.insert("attachments", std::move(attachments));
    return tbl;
}

/// Task state on top of the definition's resources and attachments.
Result<TaskState> decode_task_state(const toml::table& tbl, const TaskDefinition& def) {
    const std::string where = "task " + def.arn + " state";
    auto task_status = [](std::string_view text) { return parse_task_status(text); };

    auto known = read_enum(tbl, "known_status", TaskStatus::None, task_status, where);
    if (!known) return known.error();
    auto desired = read_enum(tbl, "desired_status", def.desired_status, task_status, where);
    if (!desired) return desired.error();
    auto sent = read_enum(tbl, "sent_status", TaskStatus::None, task_status, where);
    if (!sent) return sent.error();

    TaskState state;
    state.known_status = *known;
    state.desired_status = *desired;
    state.sent_status = *sent;
    state.stop_reason = read_string(tbl, "stop_reason");
    state.pull_started_at = read_timestamp(tbl, "pull_started_at");
    state.pull_stopped_at = read_timestamp(tbl, "pull_stopped_at");
    state.execution_stopped_at = read_timestamp(tbl, "execution_stopped_at");
    state.resources = def.resources;
    state.attachments = def.attachments;

    auto resources = for_each_table(tbl, "resources", [&](const toml::table& entry) -> Result<void> {
        const auto name = read_string(entry, "name");
        auto status = read_enum(entry, "status", TaskResourceStatus::None,
                                [](std::string_view text) { return parse_task_resource_status(text); },
                                where);
        if (!status) return status.error();
        for (auto& resource : state.resources) {
            if (resource.name == name) resource.status = *status;
        }
        return {};
    });
    if (!resources) return resources.error();

    auto attachment_status = [](std::string_view text) { return parse_attachment_status(text); };
    auto attachments = for_each_table(tbl, "attachments", [&](const toml::table& entry) -> Result<void> {
        const auto arn = read_string(entry, "arn");
        auto status = read_enum(entry, "status", AttachmentStatus::None, attachment_status, where);
        if (!status) return status.error();
        auto attachment_sent = read_enum(entry, "sent_status", AttachmentStatus::None,
                                         attachment_status, where);
        if (!attachment_sent) return attachment_sent.error();
        for (auto& attachment : state.attachments) {
            if (attachment.arn != arn) continue;
            attachment.status = *status;
            attachment.sent_status = *attachment_sent;
        }
        return {};
    });
    if (!attachments) return attachments.error();

    return state;
}

toml::table encode_task_record(const TaskRecord& record) {
    auto tbl = encode_task_definition(record.definition);
    tbl.insert("state", encode_task_state(record.state));

    // Container state lives beside each container's definition.
    if (auto* containers = tbl["containers"].as_array()) {
        for (auto& elem : *containers) {
            auto* container = elem.as_table();
            if (container == nullptr) continue;
            const auto name = (*container)["name"].value_or(std::string{});
            if (auto it = record.containers.find(name); it != record.containers.end()) {
                container->insert("state", encode_container_state(it->second));
            }
        }
    }
    return tbl;
}

Result<TaskRecord> decode_task_record(const toml::table& tbl) {
    auto def = decode_task_definition(tbl);
    if (!def) return def.error();

    TaskRecord record;
    record.definition = std::move(*def);

    if (const auto* state = tbl["state"].as_table()) {
        auto task_state = decode_task_state(*state, record.definition);
        if (!task_state) return task_state.error();
        record.state = std::move(*task_state);
    } else {
        record.state.desired_status = record.definition.desired_status;
        record.state.resources = record.definition.resources;
        record.state.attachments = record.definition.attachments;
    }

    auto containers = for_each_table(tbl, "containers", [&](const toml::table& entry) -> Result<void> {
        const auto* state = entry["state"].as_table();
        if (state == nullptr) return {};
        const auto name = read_string(entry, "name");
        auto container_state = decode_container_state(
            *state, "task " + record.definition.arn + " container " + name + " state");
        if (!container_state) return container_state.error();
        record.containers.emplace(name, std::move(*container_state));
        return {};
    });
    if (!containers) return containers.error();

    return record;
}

Result<toml::table> parse_document(std::string_view text) {
    try {
        return toml::parse(text);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Configuration,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace

// ─────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────

TaskRecord make_task_record(const Task& task) {
    TaskRecord record;
    record.definition = task.definition();
    record.state = task.snapshot();
    for (const auto& container : task.containers()) {
        record.containers.emplace(container->name(), container->snapshot());
    }
    return record;
}

std::shared_ptr<Task> restore_task(const TaskRecord& record) {
    auto task = std::make_shared<Task>(record.definition);
    task->restore(record.state);
    for (const auto& container : task->containers()) {
        if (auto it = record.containers.find(container->name()); it != record.containers.end()) {
            container->restore(it->second);
        }
    }
    return task;
}

// ─────────────────────────────────────────────
// Agent state
// ─────────────────────────────────────────────

std::string encode_state(const PersistedState& state, std::string_view agent_version) {
    toml::table doc;
    doc.insert("schema_version", kStateSchemaVersion);
    doc.insert("agent_version", std::string(agent_version));
    doc.insert("waiting", write_strings(state.waiting));

    toml::array ledger;
    for (const auto& [arn, reqs] : state.ledger) {
        ledger.push_back(toml::table{
            {"task", arn},
            {"cpu_units", static_cast<int64_t>(reqs.cpu_units)},
            {"memory_mb", static_cast<int64_t>(reqs.memory_mb)},
            {"ports", write_ports(reqs.ports)},
        });
    }
    doc.insert("ledger", std::move(ledger));

    toml::array tasks;
    for (const auto& record : state.tasks) {
        tasks.push_back(encode_task_record(record));
    }
    doc.insert("tasks", std::move(tasks));

    std::ostringstream oss;
    oss << doc << '\n';
    return oss.str();
}

Result<PersistedState> decode_state(std::string_view text) {
    auto doc = parse_document(text);
    if (!doc) return doc.error();

    const auto version = (*doc)["schema_version"].value<int64_t>();
    if (!version || *version != kStateSchemaVersion) {
        return Error{ErrorKind::Configuration,
                     "unsupported state schema version " +
                         (version ? std::to_string(*version) : std::string("(missing)"))};
    }

    PersistedState state;
    state.waiting = read_strings(*doc, "waiting");

    auto ledger = for_each_table(*doc, "ledger", [&](const toml::table& entry) -> Result<void> {
        auto arn = require_string(entry, "task", "ledger entry");
        if (!arn) return arn.error();
        state.ledger.emplace(*arn, ResourceRequirements{
            .cpu_units = read_uint(entry, "cpu_units", uint32_t{0}),
            .memory_mb = read_uint(entry, "memory_mb", uint64_t{0}),
            .ports = read_ports(entry, "ports"),
        });
        return {};
    });
    if (!ledger) return ledger.error();

    auto tasks = for_each_table(*doc, "tasks", [&](const toml::table& entry) -> Result<void> {
        auto record = decode_task_record(entry);
        if (!record) return record.error();
        state.tasks.push_back(std::move(*record));
        return {};
    });
    if (!tasks) return tasks.error();

    return state;
}

// ─────────────────────────────────────────────
// Task definitions
// ─────────────────────────────────────────────

std::string encode_task_definitions(const std::vector<TaskDefinition>& definitions) {
    toml::array tasks;
    for (const auto& def : definitions) {
        tasks.push_back(encode_task_definition(def));
    }
    toml::table doc;
    doc.insert("tasks", std::move(tasks));

    std::ostringstream oss;
    oss << doc << '\n';
    return oss.str();
}

Result<std::vector<TaskDefinition>> parse_task_definitions(std::string_view text) {
    auto doc = parse_document(text);
    if (!doc) return doc.error();

    std::vector<TaskDefinition> definitions;
    auto tasks = for_each_table(*doc, "tasks", [&](const toml::table& entry) -> Result<void> {
        auto def = decode_task_definition(entry);
        if (!def) return def.error();
        definitions.push_back(std::move(*def));
        return {};
    });
    if (!tasks) return tasks.error();
    return definitions;
}

Result<std::vector<TaskDefinition>> load_task_definitions(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorKind::NotFound, "Task definition file not found: " + path.string()};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return parse_task_definitions(oss.str());
}

}  // namespace node_agent
