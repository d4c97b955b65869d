#pragma once

#include <formflow/storage/storage.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace formflow {

struct form_field {
    std::string name;
    std::string value;
};

/// 一次成功解析的结果：按到达顺序保存的文件与普通字段
class parse_result {
public:
    // --- 字段访问 ---

    [[nodiscard]] auto field(std::string_view name) const
        -> std::optional<std::string_view>
    {
        for (auto& f : fields_) {
            if (f.name == name) return f.value;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto fields(std::string_view name) const
        -> std::vector<std::string_view>
    {
        std::vector<std::string_view> result;
        for (auto& f : fields_) {
            if (f.name == name) result.push_back(f.value);
        }
        return result;
    }

    [[nodiscard]] auto has_field(std::string_view name) const noexcept -> bool {
        for (auto& f : fields_) {
            if (f.name == name) return true;
        }
        return false;
    }

    // --- 文件访问 ---

    [[nodiscard]] auto file(std::string_view name) const -> const stored_file* {
        for (auto& f : files_) {
            if (f.field_name == name) return &f;
        }
        return nullptr;
    }

    [[nodiscard]] auto files(std::string_view name) const
        -> std::vector<const stored_file*>
    {
        std::vector<const stored_file*> result;
        for (auto& f : files_) {
            if (f.field_name == name) result.push_back(&f);
        }
        return result;
    }

    [[nodiscard]] auto has_file(std::string_view name) const noexcept -> bool {
        for (auto& f : files_) {
            if (f.field_name == name) return true;
        }
        return false;
    }

    // --- 全部 ---

    [[nodiscard]] auto all_fields() const noexcept
        -> const std::vector<form_field>& { return fields_; }

    [[nodiscard]] auto all_files() const noexcept
        -> const std::vector<stored_file>& { return files_; }

    [[nodiscard]] auto field_count() const noexcept -> std::size_t {
        return fields_.size();
    }

    [[nodiscard]] auto file_count() const noexcept -> std::size_t {
        return files_.size();
    }

    // --- 修改 ---

    void add_field(form_field f) { fields_.push_back(std::move(f)); }
    void add_file(stored_file f) { files_.push_back(std::move(f)); }

private:
    std::vector<form_field>  fields_;
    std::vector<stored_file> files_;
};

} // namespace formflow
