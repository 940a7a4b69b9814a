#include <gtest/gtest.h>

#include <QCoreApplication>

#include "tforge/build_result.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("tforge_tests");
    tforge::registerMetaTypes();
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
