// common/utils/template_renderer.h
#ifndef RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
#define RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <mutex>
#include <string>
#include <string_view>

namespace researchflow {

// Renders prompt and report templates. Includes are disabled.
class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // 静态方法：使用共享环境渲染模板（线程安全）
    // Throws InvalidInputError when the template does not render.
    static std::string render(std::string_view template_str, const Context& data);

    std::string render_with_env(std::string_view template_str, const Context& data);

private:
    inja::Environment env_;
    std::mutex mutex_;
    void configure_environment();
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_UTILS_TEMPLATE_RENDERER_H
