#include "TestDataset.h"
#include "TestLoader.h"

int main() {
    int failures = 0;

    TestDataset dataset;
    failures += QTest::qExec(&dataset);

    TestLoader loader;
    failures += QTest::qExec(&loader);

    return failures;
}
