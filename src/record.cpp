#include <fieldpath-cpp/record.hpp>
#include <fieldpath-cpp/error.hpp>

#include <mutex>
#include <utility>

namespace fieldpath_cpp {

namespace {

using FieldMap = std::map<std::string, FieldContent, std::less<>>;

// FieldSource over a record's fields for use while the record lock is
// already held. Built from a const map it is read-only.
class LockedFields final : public FieldSource {
public:
    explicit LockedFields(const FieldMap& fields) : fields_{fields} {}
    explicit LockedFields(FieldMap& fields) : fields_{fields}, writable_{&fields} {}

    auto read_field(std::string_view name) const -> FieldContent override {
        auto it = fields_.find(name);
        return it == fields_.end() ? FieldContent{} : it->second;
    }

    void write_field(std::string_view name, std::string text) override {
        if (writable_ == nullptr) {
            throw ExecutionError{"write to field '" + std::string{name} + "' under a read lock"};
        }
        writable_->insert_or_assign(std::string{name}, FieldContent{std::move(text)});
    }

private:
    const FieldMap& fields_;
    FieldMap* writable_ = nullptr;
};

}  // anonymous namespace

Record::Record()
    : engine_{std::make_shared<const Engine>()} {}

Record::Record(std::shared_ptr<const Engine> engine)
    : engine_{engine ? std::move(engine) : std::make_shared<const Engine>()} {}

Record::~Record() = default;

void Record::set_field(std::string_view name, FieldContent content) {
    auto lock = std::unique_lock{mutex_};
    fields_.insert_or_assign(std::string{name}, std::move(content));
}

void Record::clear_field(std::string_view name) {
    auto lock = std::unique_lock{mutex_};
    if (auto it = fields_.find(name); it != fields_.end()) {
        fields_.erase(it);
    }
}

auto Record::field(std::string_view name) const -> FieldContent {
    return read_field(name);
}

auto Record::field_text(std::string_view name) const -> std::optional<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto it = fields_.find(name);
    if (it == fields_.end()) return std::nullopt;
    if (const auto* text = std::get_if<std::string>(&it->second)) return *text;
    return std::nullopt;
}

auto Record::has_field(std::string_view name) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return fields_.find(name) != fields_.end();
}

auto Record::field_names() const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto names = std::vector<std::string>{};
    names.reserve(fields_.size());
    for (const auto& [name, content] : fields_) {
        names.push_back(name);
    }
    return names;
}

auto Record::read_field(std::string_view name) const -> FieldContent {
    auto lock = std::shared_lock{mutex_};
    auto it = fields_.find(name);
    return it == fields_.end() ? FieldContent{} : it->second;
}

void Record::write_field(std::string_view name, std::string text) {
    auto lock = std::unique_lock{mutex_};
    fields_.insert_or_assign(std::string{name}, FieldContent{std::move(text)});
}

auto Record::field_or_default(std::optional<std::string_view> field_name) const
    -> std::string_view {
    return field_name ? *field_name : std::string_view{engine_->options().default_field};
}

auto Record::resolve_path(std::string_view path, const Json& default_value,
                          std::optional<std::string_view> field_name) const -> Json {
    auto lock = std::shared_lock{mutex_};
    auto view = LockedFields{fields_};
    return engine_->resolve(view, path, default_value, field_or_default(field_name));
}

auto Record::update_path(std::string_view path, const Json& value,
                         std::optional<std::string_view> field_name) -> Json {
    auto lock = std::unique_lock{mutex_};
    auto view = LockedFields{fields_};
    return engine_->update(view, path, value, field_or_default(field_name));
}

auto Record::delete_path(std::string_view path,
                         std::optional<std::string_view> field_name) -> Json {
    auto lock = std::unique_lock{mutex_};
    auto view = LockedFields{fields_};
    return engine_->remove(view, path, field_or_default(field_name));
}

auto Record::locate_path(std::string_view path,
                         std::optional<std::string_view> field_name) const
    -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto view = LockedFields{fields_};
    return engine_->locate(view, path, field_or_default(field_name));
}

}  // namespace fieldpath_cpp
