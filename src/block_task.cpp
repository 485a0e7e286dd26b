#include "opflow/block_task.hpp"

namespace opflow {
inline namespace v1 {

block_task::block_task(sync_block f, std::string name)
    : task(std::move(name))
    , sync_fun_(std::move(f)) {
    if (!sync_fun_)
        throw std::invalid_argument("empty block");
}

block_task::block_task(async_block f, std::string name)
    : task(std::move(name))
    , async_fun_(std::move(f)) {
    if (!async_fun_)
        throw std::invalid_argument("empty block");
}

void block_task::execute() {
    if (async_fun_) {
        async_fun_(make_finish_signal());
        return;
    }
    sync_fun_();
    finish();
}

} // namespace v1
} // namespace opflow
