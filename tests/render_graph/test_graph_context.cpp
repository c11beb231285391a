// trellis - render graph execution engine
// Copyright (c) 2025 trellis Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <trellis/render_graph/graph_context.h>

using namespace trellis;
using namespace trellis::render_graph;

namespace {

backend::DescriptorSetHandle make_set(backend::ResourceId id) {
    backend::DescriptorSetHandle set;
    set.Id = id;
    set.Label = "set " + std::to_string(id);
    return set;
}

} // namespace

TEST_CASE("Shared resources are published and looked up by name", "[render_graph][context]") {
    RenderGraphContext context;

    SECTION("Never published") {
        REQUIRE_FALSE(context.GetSharedResource("main/output").has_value());
        REQUIRE_FALSE(context.HasSharedResource("main/output"));
        REQUIRE(context.SharedResourceCount() == 0);
    }

    SECTION("Published") {
        context.AddSharedResource("main/output", make_set(1));

        auto found = context.GetSharedResource("main/output");
        REQUIRE(found.has_value());
        REQUIRE(found->Id == 1);
        REQUIRE(context.HasSharedResource("main/output"));
    }

    SECTION("Publishing again replaces the entry") {
        context.AddSharedResource("main/output", make_set(1));
        context.AddSharedResource("main/output", make_set(2));

        REQUIRE(context.GetSharedResource("main/output")->Id == 2);
        REQUIRE(context.SharedResourceCount() == 1);
    }

    SECTION("Removal") {
        context.AddSharedResource("main/output", make_set(1));

        REQUIRE(context.RemoveSharedResource("main/output"));
        REQUIRE_FALSE(context.RemoveSharedResource("main/output"));
        REQUIRE_FALSE(context.HasSharedResource("main/output"));
    }
}

TEST_CASE("Requiring a missing resource is a per-frame error", "[render_graph][context]") {
    RenderGraphContext context;

    auto missing = context.RequireSharedResource("main/output");
    REQUIRE(missing.IsErr());
    REQUIRE(missing.GetError().Kind == core::ErrorKind::MissingSharedResource);
    REQUIRE(missing.GetError().Subject == std::optional<std::string>("main/output"));
    REQUIRE(core::IsRecoverable(missing.GetError().Kind));

    context.AddSharedResource("main/output", make_set(5));
    REQUIRE(context.RequireSharedResource("main/output").Value().Id == 5);
}

TEST_CASE("Publishers and readers are tracked for auditing", "[render_graph][context]") {
    RenderGraphContext context;

    {
        ActiveNodeGuard active(context, "main");
        context.AddSharedResource("main/output", make_set(1));
    }
    REQUIRE_FALSE(context.ActiveNode().has_value());
    REQUIRE(context.PublisherOf("main/output") == std::optional<std::string>("main"));

    context.AddSharedResource("external", make_set(2));
    REQUIRE_FALSE(context.PublisherOf("external").has_value());
    REQUIRE_FALSE(context.PublisherOf("unknown").has_value());

    SECTION("Reads by other nodes are recorded") {
        {
            ActiveNodeGuard active(context, "composite");
            context.GetSharedResource("main/output");
            context.GetSharedResource("external");
            context.GetSharedResource("unknown");
        }

        auto accesses = context.TakeAccesses();
        REQUIRE(accesses.size() == 1);
        REQUIRE(accesses[0].Reader == "composite");
        REQUIRE(accesses[0].Resource == "main/output");
        REQUIRE(accesses[0].Publisher == "main");
        REQUIRE(context.TakeAccesses().empty());
    }

    SECTION("Reads by the publisher or outside a node are not") {
        context.GetSharedResource("main/output");
        {
            ActiveNodeGuard active(context, "main");
            context.GetSharedResource("main/output");
        }
        REQUIRE(context.TakeAccesses().empty());
    }

    SECTION("Auditing can be switched off") {
        context.SetAuditSharedResources(false);
        {
            ActiveNodeGuard active(context, "composite");
            context.GetSharedResource("main/output");
        }
        REQUIRE(context.TakeAccesses().empty());
        REQUIRE_FALSE(context.AuditSharedResources());
    }
}
