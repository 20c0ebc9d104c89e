#include <QCoreApplication>

#include <gtest/gtest.h>

// QTimer needs an application object; tests run without a display so a
// QCoreApplication is enough.
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
