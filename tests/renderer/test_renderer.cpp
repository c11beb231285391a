// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <trellis/backend/software_backend.h>
#include <trellis/core/config.h>
#include <trellis/core/error.h>
#include <trellis/renderer/renderer.h>
#include <trellis/viewer/passes.h>

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "../support/test_nodes.h"

using namespace trellis;
using namespace trellis::renderer;
using backend::SoftwareBackend;

namespace {

struct SoftwareRenderer {
    SoftwareBackend* backend = nullptr;
    std::unique_ptr<Renderer> renderer;

    explicit SoftwareRenderer(glm::uvec2 extent = glm::uvec2(320, 240)) {
        backend::RenderBackendConfig config;
        config.SurfaceExtent = extent;
        auto owned = std::make_unique<SoftwareBackend>(config);
        backend = owned.get();
        renderer = std::make_unique<Renderer>(std::move(owned));
    }
};

// Descriptor set bound at slot 0 by a recorded pass
backend::DescriptorSetHandle bound_set(const backend::PassSubmission& pass) {
    for (const auto& command : pass.Commands) {
        if (const auto* bind = std::get_if<backend::cmd::BindDescriptorSet>(&command)) {
            if (bind->Slot == 0) {
                return bind->Set;
            }
        }
    }
    return {};
}

// Texture written into a descriptor set by the software backend
backend::ResourceId sampled_texture(const SoftwareBackend& backend, const backend::DescriptorSetHandle& set) {
    const auto* writes = backend.DescriptorSetWrites(set);
    if (writes == nullptr) {
        return backend::INVALID_RESOURCE_ID;
    }
    for (const auto& write : *writes) {
        if (write.Type == backend::DescriptorBindingType::TextureView) {
            return write.Resource;
        }
    }
    return backend::INVALID_RESOURCE_ID;
}

class WorldProbe : public render_graph::RenderNode {
public:
    explicit WorldProbe(std::shared_ptr<size_t> seen) : seen_(std::move(seen)) {}

    render_graph::RenderNodeDescriptor Setup(RenderContext&, render_graph::RenderGraphContext&) override { return {}; }

    core::Result<void> Draw(RenderContext&, render_graph::RenderNodeContext&, render_graph::RenderGraphContext&,
                            World world) override {
        *seen_ = world.Drawables.size();
        return core::Result<void>::Ok();
    }

private:
    std::shared_ptr<size_t> seen_;
};

class Quad : public Drawable {
public:
    const backend::BufferHandle& VertexBuffer() const override { return vertices_; }
    const backend::BufferHandle& IndexBuffer() const override { return indices_; }

private:
    backend::BufferHandle vertices_;
    backend::BufferHandle indices_;
};

} // namespace

TEST_CASE("Main pass output is composited onto the surface", "[renderer][scenario]") {
    SoftwareRenderer sw;
    viewer::RegisterFractalGraph(*sw.renderer);

    auto status = sw.renderer->BeginDraw(World{});
    REQUIRE(status.IsOk());
    REQUIRE(status.Value() == FrameStatus::Presented);

    REQUIRE(sw.backend->Frames().size() == 1);
    const auto& frame = sw.backend->Frames()[0];
    REQUIRE(frame.Presented);
    REQUIRE(frame.Passes.size() == 2);
    REQUIRE(frame.Passes[0].Label == "main");
    REQUIRE(frame.Passes[1].Label == "composite");

    const auto& mainTarget = frame.Passes[0].Target;
    REQUIRE(mainTarget.IsTexture());
    REQUIRE(frame.Passes[1].Target.IsSurface());

    auto published = sw.renderer->RenderGraphRef().Context().GetSharedResource(viewer::MAIN_OUTPUT);
    REQUIRE(published.has_value());

    auto sampled = bound_set(frame.Passes[1]);
    REQUIRE(sampled.Id == published->Id);
    REQUIRE(sampled_texture(*sw.backend, sampled) == mainTarget.GetTexture().Id);
    REQUIRE(sw.renderer->FrameIndex() == 1);
}

TEST_CASE("Composite follows the main pass across a resize", "[renderer][scenario]") {
    SoftwareRenderer sw;
    viewer::RegisterFractalGraph(*sw.renderer);
    REQUIRE(sw.renderer->BeginDraw(World{}).IsOk());
    const auto firstTexture = sw.backend->Frames()[0].Passes[0].Target.GetTexture();

    sw.renderer->Resize(glm::uvec2(640, 480));
    REQUIRE(sw.backend->SurfaceExtent() == glm::uvec2(640, 480));

    REQUIRE(sw.renderer->BeginDraw(World{}).Value() == FrameStatus::Presented);
    const auto& frame = sw.backend->Frames()[1];
    const auto& texture = frame.Passes[0].Target.GetTexture();

    REQUIRE(texture.Id != firstTexture.Id);
    REQUIRE(texture.Extent() == glm::uvec2(640, 480));
    REQUIRE(sampled_texture(*sw.backend, bound_set(frame.Passes[1])) == texture.Id);
    REQUIRE(sw.renderer->RenderGraphRef().UndeclaredDependencies().empty());
}

TEST_CASE("Outdated surfaces skip the frame", "[renderer][frame]") {
    SoftwareRenderer sw;
    viewer::RegisterFractalGraph(*sw.renderer);

    sw.backend->SimulateSurfaceLoss();
    auto skipped = sw.renderer->BeginDraw(World{});
    REQUIRE(skipped.IsOk());
    REQUIRE(skipped.Value() == FrameStatus::Skipped);
    REQUIRE(sw.backend->Frames().empty());

    auto retried = sw.renderer->BeginDraw(World{});
    REQUIRE(retried.Value() == FrameStatus::Presented);
    REQUIRE(sw.backend->PresentedFrameCount() == 1);
}

TEST_CASE("Device loss is a fatal error", "[renderer][frame]") {
    SoftwareRenderer sw;
    viewer::RegisterFractalGraph(*sw.renderer);
    sw.backend->SimulateDeviceLoss();

    auto status = sw.renderer->BeginDraw(World{});
    REQUIRE(status.IsErr());
    REQUIRE(status.GetError().Kind == core::ErrorKind::FatalBackend);
    REQUIRE(core::IsFatal(status.GetError().Kind));
}

TEST_CASE("Node failures drop the frame without presenting", "[renderer][frame]") {
    SoftwareRenderer sw;
    auto log = std::make_shared<test::CallLog>();
    test::NodeBehavior failing;
    failing.FailDraw = core::ErrorKind::NodeDraw;

    sw.renderer->Graph()
        .Emplace<test::RecordingNode>("a", "a", log, failing)
        .Emplace<test::RecordingNode>("b", "b", log)
        .AddEdge("a", "b");

    auto status = sw.renderer->BeginDraw(World{});
    REQUIRE(status.IsErr());
    REQUIRE(status.GetError().Kind == core::ErrorKind::NodeDraw);
    REQUIRE(sw.backend->PresentedFrameCount() == 0);
    REQUIRE(sw.backend->Frames().size() == 1);
    REQUIRE_FALSE(sw.backend->Frames()[0].Presented);
    REQUIRE(sw.backend->CurrentFrame() == nullptr);

    SECTION("The renderer keeps going") {
        REQUIRE(sw.renderer->BeginDraw(World{}).IsErr());
        REQUIRE(log->Draws == std::vector<std::string>{"a", "a"});
        REQUIRE(sw.renderer->FrameIndex() == 2);
    }
}

// Creates a texture inside Draw; the first draw asks for an invalid one
class TextureOnDrawNode : public render_graph::RenderNode {
public:
    explicit TextureOnDrawNode(std::shared_ptr<test::CallLog> log) : log_(std::move(log)) {}

    render_graph::RenderNodeDescriptor Setup(RenderContext&, render_graph::RenderGraphContext&) override {
        return {};
    }

    core::Result<void> Draw(RenderContext& ctx,
                            render_graph::RenderNodeContext&,
                            render_graph::RenderGraphContext&,
                            World) override {
        log_->Draws.push_back("scratch");
        backend::TextureCreateInfo info;
        info.Label = "scratch";
        if (log_->Draws.size() > 1) {
            info.Width = 16;
            info.Height = 16;
        }
        ctx.DestroyTexture(ctx.CreateTexture(info));
        return core::Result<void>::Ok();
    }

private:
    std::shared_ptr<test::CallLog> log_;
};

// Throws from Draw on the first frame only
class ThrowOnceNode : public render_graph::RenderNode {
public:
    explicit ThrowOnceNode(std::function<void()> raise) : raise_(std::move(raise)) {}

    render_graph::RenderNodeDescriptor Setup(RenderContext&, render_graph::RenderGraphContext&) override {
        return {};
    }

    core::Result<void> Draw(RenderContext&,
                            render_graph::RenderNodeContext&,
                            render_graph::RenderGraphContext&,
                            World) override {
        if (raise_) {
            auto raise = std::move(raise_);
            raise_ = nullptr;
            raise();
        }
        return core::Result<void>::Ok();
    }

private:
    std::function<void()> raise_;
};

TEST_CASE("Resource creation failing inside Draw drops only that frame", "[renderer][frame]") {
    SoftwareRenderer sw;
    auto log = std::make_shared<test::CallLog>();
    sw.renderer->Graph().Emplace<TextureOnDrawNode>("scratch", log);

    auto first = sw.renderer->BeginDraw(World{});
    REQUIRE(first.IsErr());
    REQUIRE(first.GetError().Kind == core::ErrorKind::NodeDraw);
    REQUIRE(first.GetError().Subject == std::optional<std::string>("scratch"));
    REQUIRE_THAT(first.GetError().Message, Catch::Matchers::ContainsSubstring("invalid extent 0x0"));
    REQUIRE(sw.backend->CurrentFrame() == nullptr);
    REQUIRE(sw.renderer->FrameIndex() == 1);

    for (int frame = 0; frame < 3; ++frame) {
        auto next = sw.renderer->BeginDraw(World{});
        REQUIRE(next.IsOk());
        REQUIRE(next.Value() == FrameStatus::Presented);
    }
    REQUIRE(sw.backend->PresentedFrameCount() == 3);
    REQUIRE(log->Draws.size() == 4);
}

TEST_CASE("Exceptions thrown from Draw close the frame", "[renderer][frame]") {
    SoftwareRenderer sw;

    SECTION("A lost device inside Draw is fatal") {
        sw.renderer->Graph().Emplace<ThrowOnceNode>("main", [] {
            throw backend::BackendError::DeviceLost("texture upload");
        });

        auto status = sw.renderer->BeginDraw(World{});
        REQUIRE(status.IsErr());
        REQUIRE(status.GetError().Kind == core::ErrorKind::FatalBackend);
        REQUIRE(sw.backend->CurrentFrame() == nullptr);
    }

    SECTION("Other exceptions propagate after the frame is abandoned") {
        sw.renderer->Graph().Emplace<ThrowOnceNode>("main", [] { throw std::runtime_error("node bug"); });

        REQUIRE_THROWS_AS(sw.renderer->BeginDraw(World{}), std::runtime_error);
        REQUIRE(sw.backend->CurrentFrame() == nullptr);
        REQUIRE(sw.renderer->FrameIndex() == 1);
        REQUIRE_FALSE(sw.renderer->RenderGraphRef().Context().ActiveNode().has_value());

        REQUIRE(sw.renderer->BeginDraw(World{}).Value() == FrameStatus::Presented);
    }
}

TEST_CASE("Resizing releases the previous main output", "[renderer][scenario]") {
    SoftwareRenderer sw;
    viewer::RegisterFractalGraph(*sw.renderer);
    REQUIRE(sw.renderer->BeginDraw(World{}).IsOk());
    const auto objects = sw.backend->ObjectCount();

    for (uint32_t step = 1; step <= 3; ++step) {
        sw.renderer->Resize(glm::uvec2(320 + 16 * step, 240));
        REQUIRE(sw.renderer->BeginDraw(World{}).Value() == FrameStatus::Presented);
    }
    REQUIRE(sw.backend->ObjectCount() == objects);
}

TEST_CASE("Structural errors surface from BeginDraw", "[renderer][frame]") {
    SoftwareRenderer sw;
    auto log = std::make_shared<test::CallLog>();
    sw.renderer->Graph().Emplace<test::RecordingNode>("main", "main", log).AddEdge("main", "composite");

    auto status = sw.renderer->BeginDraw(World{});
    REQUIRE(status.IsErr());
    REQUIRE(status.GetError().Kind == core::ErrorKind::UnknownNode);
    REQUIRE(sw.backend->CurrentFrame() == nullptr);
}

TEST_CASE("Nodes without a pipeline cannot submit passes", "[renderer][frame]") {
    SoftwareRenderer sw;
    render_graph::RenderNodeContext node;
    node.Name = "main";

    auto result = sw.renderer->Context().Render(node, [](backend::FrameBuilder&) {});
    REQUIRE(result.IsErr());
    REQUIRE(result.GetError().Kind == core::ErrorKind::NodeDraw);
}

TEST_CASE("The world is passed to every node", "[renderer][frame]") {
    SoftwareRenderer sw;
    auto seen = std::make_shared<size_t>(0);
    sw.renderer->Graph().Emplace<WorldProbe>("probe", seen);

    Quad first;
    Quad second;
    const std::array<const Drawable*, 2> drawables{&first, &second};

    REQUIRE(sw.renderer->BeginDraw(World{drawables, {}}).IsOk());
    REQUIRE(*seen == 2);
}

TEST_CASE("Renderer construction", "[renderer]") {
    SECTION("From config") {
        config::AppConfig config;
        config.window_width = 400;
        config.window_height = 300;
        config.audit_shared_resources = false;

        auto software = Renderer::Create(config);
        REQUIRE_FALSE(software.IsHeadless());
        REQUIRE(software.Backend().Name() == "software");
        REQUIRE(software.Context().SurfaceExtent() == glm::uvec2(400, 300));
        REQUIRE_FALSE(software.RenderGraphRef().Context().AuditSharedResources());

        config.backend = config::BackendKind::Headless;
        REQUIRE(Renderer::Create(config).IsHeadless());
    }

    SECTION("Null backend") {
        REQUIRE_THROWS_AS(Renderer(nullptr), TrellisError);
    }

    SECTION("Headless renderers cannot draw") {
        auto headless = Renderer::Headless(glm::uvec2(64, 64));
        auto status = headless.BeginDraw(World{});

        REQUIRE(status.IsErr());
        REQUIRE(status.GetError().Kind == core::ErrorKind::Headless);

        headless.Resize(glm::uvec2(128, 128));
        REQUIRE(headless.Backend().SurfaceExtent() == glm::uvec2(128, 128));
    }
}
