// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include "core/types/errors.h"
#include <cmath>
#include <cstdio>
#include <filesystem>

namespace researchflow {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    // markdown headings start with "##", inja's default line statement prefix
    env_.set_line_statement("%%");
    env_.set_trim_blocks(true);
    env_.set_lstrip_blocks(true);

    configure_environment();
}

void InjaTemplateRenderer::configure_environment() {
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled.", inja::SourceLocation{});
    });

    // fixed(value, digits): number formatted with a fixed number of decimals
    env_.add_callback("fixed", 2, [](inja::Arguments& args) -> nlohmann::json {
        const auto& v = *args.at(0);
        if (!v.is_number()) return "N/A";
        int digits = args.at(1)->get<int>();
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.*f", digits, v.get<double>());
        return std::string(buf);
    });

    // billions(value): market cap style "2890.12B"
    env_.add_callback("billions", 1, [](inja::Arguments& args) -> nlohmann::json {
        const auto& v = *args.at(0);
        if (!v.is_number()) return "N/A";
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.2fB", v.get<double>() / 1e9);
        return std::string(buf);
    });

    // signed_pct(value): "+3.2%"
    env_.add_callback("signed_pct", 1, [](inja::Arguments& args) -> nlohmann::json {
        const auto& v = *args.at(0);
        if (!v.is_number()) return "N/A";
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%+.1f%%", v.get<double>());
        return std::string(buf);
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& data) {
    static InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, data);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& data) {
    // inja::Environment keeps parse state; serialize access
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        return env_.render(template_str, data);
    } catch (const inja::InjaError& e) {
        throw InvalidInputError("Template render error: " + std::string(e.message));
    }
}

} // namespace researchflow
