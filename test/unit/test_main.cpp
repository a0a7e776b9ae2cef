#include <gtest/gtest.h>
#include <iostream>

// 测试主函数
int main(int argc, char** argv) {
    std::cout << "colstore 单元测试开始..." << std::endl;

    // 死亡测试重新执行测试程序，不依赖fork时的单例状态
    ::testing::GTEST_FLAG(death_test_style) = "threadsafe";
    ::testing::InitGoogleTest(&argc, argv);

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        std::cout << "所有测试通过！" << std::endl;
    } else {
        std::cout << "有测试失败！" << std::endl;
    }

    return result;
}
