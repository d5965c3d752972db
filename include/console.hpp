#pragma once

#include <mutex>

namespace gfc_extract {

// 並列タスクからのコンソール出力を直列化するためのミューテックス
// 出力する側で std::lock_guard を取ってから std::cout / std::cerr に書く
std::mutex& console_mutex();

}  // namespace gfc_extract
