#include "fastdocx/FastDocx.hpp"

#include <gtest/gtest.h>
#include <iostream>

// 各测试夹具自行初始化日志，这里只输出版本和汇总
int main(int argc, char** argv) {
    std::cout << "FastDocx " << fastdocx::getVersion() << " 单元测试" << std::endl;

    ::testing::InitGoogleTest(&argc, argv);
    int result = RUN_ALL_TESTS();

    std::cout << (result == 0 ? "全部通过" : "存在失败的测试") << std::endl;
    return result;
}
