#include <algorithm>
#include <cassert>
#include <cmath>

#include "pyro/engine/config.hpp"
#include "pyro/model/firework.hpp"
#include "support/recording_surface.hpp"
#include "support/scripted_random.hpp"
#include "support/test_util.hpp"

using namespace pyro;
using pyro::test::near;

static const model::Rgb RED{255, 0, 0};

int main()
{
  const engine::SimulationConfig cfg;

  // A fresh firework is a white, immortal 1x3 rocket
  {
    model::Firework fw(10, 100, -1.5, RED);
    const model::Particle *rocket = fw.rocket();
    assert(rocket != nullptr);
    assert(!fw.exploded());
    assert(fw.effect().empty());
    assert(rocket->dimensions().width == 1 && rocket->dimensions().height == 3);
    assert((rocket->color() == model::WHITE));
    assert(rocket->fading() == 0.0);
    assert(near(rocket->velocity().y, -1.5) && rocket->velocity().x == 0.0);
    assert(near(rocket->acceleration().y, 0.02) && rocket->acceleration().x == 0.0);
    assert(near(rocket->position().x, 10.0) && near(rocket->position().y, 100.0));
    assert(near(fw.baseColor().h, 0.0) && near(fw.baseColor().s, 100.0) &&
           near(fw.baseColor().l, 50.0));
    assert(!fw.isDead());
    assert(fw.liveParticleCount() == 1);
  }

  // Rocket climbs until it slows past the detonation speed, then bursts once
  {
    test::ScriptedRandom rng;
    model::Firework fw(10, 100, -1.5, RED);

    int detonationTick = -1;
    double expectedOriginY = 0.0;
    for (int tick = 1; tick <= 200; ++tick)
    {
      const model::Particle *before = fw.rocket();
      assert(before != nullptr);
      const double prevY = before->position().y;
      const double prevVy = before->velocity().y;

      fw.update(rng, cfg);

      if (const model::Particle *after = fw.rocket())
      {
        assert(after->position().y < prevY);
        assert(after->velocity().y <= cfg.detonationSpeed);
        assert(fw.effect().empty());
        assert(rng.uniformCalls == 0);
      }
      else
      {
        detonationTick = tick;
        expectedOriginY = std::round(prevY + (prevVy + cfg.gravity));
        break;
      }
    }

    // v = -1.5 + 0.02 k crosses -0.3 at k = 60
    assert(detonationTick >= 59 && detonationTick <= 61);
    assert(fw.exploded());
    assert(fw.rocket() == nullptr);
    assert(fw.effect().size() == cfg.burstSize);
    assert(fw.effect().size() == 25);
    assert(rng.uniformCalls == 4 * 25);

    // U = 0.5 everywhere: no color jitter, vx = 0, vy = 1.5 * (0.5 - 0.9) = -0.6,
    // then one update in the detonation tick.
    for (const auto &spark : fw.effect())
    {
      assert(spark.dimensions().width == 1 && spark.dimensions().height == 1);
      assert((spark.color() == RED));
      assert(near(spark.velocity().x, 0.0) && near(spark.velocity().y, -0.58));
      assert(near(spark.position().x, 10.0));
      assert(near(spark.position().y, expectedOriginY - 0.58));
      assert(near(spark.lifetime(), 1.0 - cfg.effectFading));
    }
    assert(!fw.isDead());
    assert(fw.liveParticleCount() == 25);

    // Burst never grows and eventually fades out entirely
    int ticks = 0;
    while (!fw.isDead())
    {
      fw.update(rng, cfg);
      assert(fw.effect().size() == 25);
      assert(fw.rocket() == nullptr);
      assert(++ticks < 200);
    }
    assert(ticks >= 98 && ticks <= 101);
    assert(fw.liveParticleCount() == 0);

    for (int i = 0; i < 50; ++i)
      fw.update(rng, cfg);
    assert(fw.isDead());
    assert(fw.effect().size() == 25);
  }

  // Saturation/lightness jitter is clamped to [0,100]
  {
    test::ScriptedRandom rng;
    // first spark: s -20, l -40, vx = -0.75, vy = -1.35
    rng.uniforms = {0.0, 0.0, 0.0, 0.0};
    // white seed: s = 0, l = 100
    model::Firework fw(3, 3, -0.1, model::WHITE);
    fw.update(rng, cfg);
    assert(fw.exploded());
    assert(fw.effect().size() == 25);

    const auto &first = fw.effect()[0];
    assert((first.color() == model::Rgb{153, 153, 153}));
    assert(near(first.velocity().x, -0.75));
    assert(near(first.velocity().y, -1.35 + cfg.gravity));

    // the rest fell back to U = 0.5: l stays at 100
    for (std::size_t i = 1; i < fw.effect().size(); ++i)
      assert((fw.effect()[i].color() == model::WHITE));
  }

  // Jittered hue is preserved
  {
    test::ScriptedRandom rng;
    rng.uniforms = {1.0, 0.25};
    const model::Rgb seed{40, 120, 200};
    model::Firework fw(0, 50, -0.2, seed);
    fw.update(rng, cfg);
    assert(fw.exploded());

    const model::Hsl base = model::toHsl(seed);
    const model::Rgb expected =
        model::toRgb({base.h, std::clamp(base.s + 20.0, 0.0, 100.0), base.l - 20.0});
    assert((fw.effect()[0].color() == expected));
    const model::Hsl got = model::toHsl(fw.effect()[0].color());
    assert(std::abs(got.h - base.h) < 2.0);
  }

  // A rocket that already moves slower than the threshold bursts on its first update
  {
    test::ScriptedRandom rng;
    model::Firework fw(5, 10, -0.1, RED);
    assert(!fw.isDead());
    fw.update(rng, cfg);
    assert(fw.exploded());
    assert(fw.effect().size() == 25);
  }

  // Draw order: rocket first, then the effect
  {
    test::ScriptedRandom rng;
    model::Firework fw(7, 20, -1.5, RED);
    test::RecordingSurface surface;
    fw.draw(surface);
    auto rects = surface.rects();
    assert(rects.size() == 1);
    assert(rects[0].x == 7 && rects[0].y == 20);
    assert(rects[0].width == 1 && rects[0].height == 3);
    assert((rects[0].color == model::WHITE));

    while (!fw.exploded())
      fw.update(rng, cfg);
    surface.calls.clear();
    fw.draw(surface);
    rects = surface.rects();
    assert(rects.size() == 25);
    for (const auto &r : rects)
      assert(r.width == 1 && r.height == 1);
  }

  return 0;
}
