#include "stagescript_test_harness.hpp"
#include "stagescript_classifier_tests.hpp"
#include "stagescript_segmenter_tests.hpp"
#include "stagescript_scanner_tests.hpp"
#include "stagescript_parser_tests.hpp"
#include "stagescript_serializer_tests.hpp"

namespace stagescript::tests
{
    std::vector<test_result> results;
    char const *             last_error = "";
    std::string              current_suite;
}

int main()
{
    using namespace stagescript::tests;

    #ifdef STAGESCRIPT_TESTS_CLASSIFIER__
        run_suite("Line classifier", run_classifier_tests);
    #endif

    #ifdef STAGESCRIPT_TESTS_SEGMENTER__
        run_suite("Inline segmenter", run_segmenter_tests);
    #endif

    #ifdef STAGESCRIPT_TESTS_SCANNER__
        run_suite("Block scanner", run_scanner_tests);
    #endif

    #ifdef STAGESCRIPT_TESTS_PARSER__
        run_suite("Parser", run_parser_tests);
    #endif

    #ifdef STAGESCRIPT_TESTS_SERIALIZER__
        run_suite("Interchange", run_serializer_tests);
    #endif

    return summarise();
}
