#include <iostream>
#include <exception>
// Only GTest::gtest is linked (not gtest_main): the assert-style smoke drivers run first,
// then every TEST compiled into this binary.
#include <gtest/gtest.h>

void run_parser_smoke_test();
void run_printer_smoke_test();
void run_pipeline_smoke_test();

int main(int argc, char** argv){
    try{
        // Parse a representative chunk in both dialects
        run_parser_smoke_test();
        // Print styles agree on meaning
        run_printer_smoke_test();
        // Every preset end to end
        run_pipeline_smoke_test();
    }catch(const std::exception& e){ std::cerr << "[smoke] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
