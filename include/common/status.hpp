#pragma once

namespace localjudge {

/**
 * @brief 表示一次运行或一个测试点的评测结果
 */
enum class status {
    /**
     * @brief 答案正确
     * 宽松比较模式下，行首行尾空白字符与空行的差异不影响结果。
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 严格比较模式下，任何字节差异（包括行末空格、文末空行）都会返回 WA。
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 程序运行时间（时钟时间）达到时间限制
     * 不论输出是否正确，只要超时就返回 TLE，此时保留被杀死前的部分输出。
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 程序以非零返回值退出，或者因为信号崩溃
     */
    RUNTIME_ERROR = 3,

    /**
     * @brief 测试点没有对应的 .out 文件，无法比较
     * 这不是错误，程序的输出仍然可以被查看。
     */
    MISSING = 4
};

/**
 * @brief 评测结果的缩写，比如 "WA"
 */
const char *get_short_name(status);

}  // namespace localjudge
