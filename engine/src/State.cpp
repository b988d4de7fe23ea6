#include "inv/game/State.hpp"
#include "inv/util/Log.hpp"
#include <cassert>

using namespace inv::game;

void EnemyCount::decrement() {
    assert(value_ > 0 && "enemy count underflow");
    if (value_ == 0) {
        inv::log::error("EnemyCount: decrement below zero ignored");
        return;
    }
    --value_;
}
