#include "trellis/training/training_plugin.hpp"

namespace trellis::training {

void training_plugin::build(context& ctx) {
    ctx.add_table<trainer>("trainer");
    ctx.add_table<client>("client");
    ctx.add_table<exercise>("exercise");
    ctx.add_table<training_session>("session");
}

} // namespace trellis::training
