#include <catch2/catch.hpp>

#include "normalizer.hpp"
#include "camera_framing.hpp"
#include "scene.hpp"
#include "quality_controller.hpp"
#include "test_helpers.hpp"

static constexpr size_t MiB = 1024 * 1024;

struct SceneFixture
{
	SceneFixture():
		normalized{normalize_mesh(make_unit_cube())},
		scene{assemble_scene(normalized.mesh,
			frame_camera(normalized.mesh, FramingParams{}), SceneStyle{})}
	{}

	NormalizedMesh normalized;
	SceneDescription scene;
};

static const BackendPlan gpu_then_cpu{
	RendererBackend::Gpu, RendererBackend::Software
};

// ============================================================================
// Resolution degradation
// ============================================================================

TEST_CASE_METHOD(SceneFixture, "Resolution halves until the budget fits",
	"[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu,
		fake_encoder({{1024, 6 * MiB}, {512, 4 * MiB}})};

	QualityBudget budget;
	budget.source_bytes = 10 * MiB;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.resolution == 512);
	REQUIRE(a.bytes == 4 * MiB);
	REQUIRE(a.png.size() == a.bytes);
	REQUIRE(a.backend == RendererBackend::Gpu);
	REQUIRE(qc.attempts() == 2);
	REQUIRE(qc.state() == BackendState::Primary);
	REQUIRE_FALSE(qc.used_fallback());

	REQUIRE(fakes.renderers.size() == 1);
	REQUIRE(fakes.renderers[0]->resolutions
		== std::vector<uint32_t>{1024, 512});
}

TEST_CASE_METHOD(SceneFixture, "First attempt within budget is kept",
	"[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu, fake_encoder({}, 100)};

	QualityBudget budget;
	budget.source_bytes = 1000;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.resolution == 1024);
	REQUIRE(qc.attempts() == 1);
}

TEST_CASE_METHOD(SceneFixture, "Floor resolution is accepted over budget",
	"[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu,
		fake_encoder({}, 10 * MiB)};

	QualityBudget budget;
	budget.source_bytes = 1000;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.resolution == 64);
	REQUIRE(a.bytes == 10 * MiB);
	REQUIRE(qc.attempts() == QualityController::max_attempts(budget));
	REQUIRE(fakes.renderers[0]->resolutions
		== std::vector<uint32_t>{1024, 512, 256, 128, 64});
}

TEST_CASE_METHOD(SceneFixture, "Halving stops at the floor, not below",
	"[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu,
		fake_encoder({}, 10 * MiB)};

	QualityBudget budget;
	budget.start = 1000;
	budget.floor = 100;
	budget.source_bytes = 1000;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.resolution == 100);
	REQUIRE(fakes.renderers[0]->resolutions
		== std::vector<uint32_t>{1000, 500, 250, 125, 100});
	REQUIRE(qc.attempts() <= QualityController::max_attempts(budget));
}

TEST_CASE("Iteration bound", "[quality]")
{
	QualityBudget b;
	REQUIRE(QualityController::max_attempts(b) == 5);

	b.start = 64;
	REQUIRE(QualityController::max_attempts(b) == 1);

	b.start = 32;
	REQUIRE(QualityController::max_attempts(b) == 1);

	b.start = 1000;
	b.floor = 100;
	REQUIRE(QualityController::max_attempts(b) == 5);
}

TEST_CASE_METHOD(SceneFixture, "Zero resolutions are rejected", "[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu, fake_encoder({})};

	QualityBudget budget;
	budget.floor = 0;
	REQUIRE_THROWS_AS(qc.run(scene, budget), std::invalid_argument);

	budget.floor = 64;
	budget.start = 0;
	REQUIRE_THROWS_AS(qc.run(scene, budget), std::invalid_argument);
}

// ============================================================================
// Backend fallback
// ============================================================================

TEST_CASE_METHOD(SceneFixture, "Unavailable GPU falls back to the CPU",
	"[quality][fallback]")
{
	FakeRendererFactory fakes;
	fakes.behavior[RendererBackend::Gpu] = FakeBehavior::InitFails;
	QualityController qc{fakes.make(), gpu_then_cpu, fake_encoder({}, 10)};

	QualityBudget budget;
	budget.source_bytes = 1000;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.backend == RendererBackend::Software);
	REQUIRE(qc.used_fallback());
	REQUIRE(qc.state() == BackendState::Fallback);

	SECTION("failed backend is not initialized again") {
		qc.run(scene, budget);
		REQUIRE(fakes.created[RendererBackend::Gpu] == 1);
		REQUIRE(fakes.created[RendererBackend::Software] == 1);
		REQUIRE(qc.used_fallback());
	}
}

TEST_CASE_METHOD(SceneFixture, "Render failure mid-run switches backend",
	"[quality][fallback]")
{
	FakeRendererFactory fakes;
	fakes.behavior[RendererBackend::Gpu] = FakeBehavior::RenderFails;
	QualityController qc{fakes.make(), gpu_then_cpu,
		fake_encoder({{1024, 6 * MiB}}, 100)};

	QualityBudget budget;
	budget.source_bytes = 10 * MiB;

	const RenderAttempt a = qc.run(scene, budget);
	REQUIRE(a.backend == RendererBackend::Software);
	REQUIRE(a.resolution == 512);
	REQUIRE(qc.attempts() == 2);
}

TEST_CASE_METHOD(SceneFixture, "No fallback left", "[quality][fallback]")
{
	FakeRendererFactory fakes;

	SECTION("single backend plan") {
		fakes.behavior[RendererBackend::Gpu] = FakeBehavior::InitFails;
		QualityController qc{fakes.make(),
			BackendPlan{RendererBackend::Gpu, std::nullopt},
			fake_encoder({})};

		REQUIRE_THROWS_AS(qc.run(scene, QualityBudget{}), BackendInitError);
		REQUIRE(qc.state() == BackendState::Fail);
		REQUIRE(fakes.created[RendererBackend::Software] == 0);
	}

	SECTION("fallback fails too") {
		fakes.behavior[RendererBackend::Gpu] = FakeBehavior::InitFails;
		fakes.behavior[RendererBackend::Software] = FakeBehavior::RenderFails;
		QualityController qc{fakes.make(), gpu_then_cpu, fake_encoder({})};

		REQUIRE_THROWS_AS(qc.run(scene, QualityBudget{}), RenderError);
		REQUIRE(qc.state() == BackendState::Fail);
	}
}

TEST_CASE_METHOD(SceneFixture, "Frames of the wrong size are render failures",
	"[quality][fallback]")
{
	FakeRendererFactory fakes;
	fakes.behavior[RendererBackend::Gpu] = FakeBehavior::WrongSize;

	QualityBudget budget;
	budget.source_bytes = 1000;

	SECTION("the fallback renders instead") {
		QualityController qc{fakes.make(), gpu_then_cpu,
			fake_encoder({}, 10)};
		const RenderAttempt a = qc.run(scene, budget);
		REQUIRE(a.backend == RendererBackend::Software);
		REQUIRE(a.resolution == 1024);
		REQUIRE(qc.used_fallback());
	}

	SECTION("without a fallback") {
		QualityController qc{fakes.make(),
			BackendPlan{RendererBackend::Gpu, std::nullopt},
			fake_encoder({}, 10)};
		REQUIRE_THROWS_AS(qc.run(scene, budget), RenderError);
		REQUIRE(qc.state() == BackendState::Fail);
	}
}

TEST_CASE_METHOD(SceneFixture, "Running out of memory is a render failure",
	"[quality][fallback]")
{
	FakeRendererFactory fakes;
	fakes.behavior[RendererBackend::Gpu] = FakeBehavior::OutOfMemory;

	QualityBudget budget;
	budget.source_bytes = 1000;

	SECTION("the fallback renders instead") {
		QualityController qc{fakes.make(), gpu_then_cpu,
			fake_encoder({}, 10)};
		REQUIRE(qc.run(scene, budget).backend == RendererBackend::Software);
	}

	SECTION("both backends out of memory") {
		fakes.behavior[RendererBackend::Software] = FakeBehavior::OutOfMemory;
		QualityController qc{fakes.make(), gpu_then_cpu,
			fake_encoder({}, 10)};
		REQUIRE_THROWS_AS(qc.run(scene, budget), RenderError);
	}
}

TEST_CASE_METHOD(SceneFixture, "Single frame at a fixed size",
	"[quality][turntable]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu,
		fake_encoder({}, 10 * MiB)};

	const RenderAttempt a = qc.render_frame(scene, 512);
	REQUIRE(a.resolution == 512);
	REQUIRE(qc.attempts() == 1);
	REQUIRE(fakes.renderers[0]->resolutions == std::vector<uint32_t>{512});
}

TEST_CASE_METHOD(SceneFixture, "Plan changes keep created renderers",
	"[quality]")
{
	FakeRendererFactory fakes;
	QualityController qc{fakes.make(), gpu_then_cpu, fake_encoder({}, 10)};

	QualityBudget budget;
	budget.source_bytes = 1000;

	qc.run(scene, budget);
	qc.set_plan(BackendPlan{RendererBackend::Software, std::nullopt});
	REQUIRE(qc.run(scene, budget).backend == RendererBackend::Software);

	qc.set_plan(gpu_then_cpu);
	REQUIRE(qc.run(scene, budget).backend == RendererBackend::Gpu);
	REQUIRE(fakes.created[RendererBackend::Gpu] == 1);
	REQUIRE(fakes.created[RendererBackend::Software] == 1);
}
