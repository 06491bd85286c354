#pragma once

namespace arena {

/**
 * @brief 将多个 lambda 组合为一个访问者，配合 std::visit 处理 job_payload
 */
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template <class... Ts>
overloaded(Ts...)->overloaded<Ts...>;

}  // namespace arena
