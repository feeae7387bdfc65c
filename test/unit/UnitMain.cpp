//===----------------------------------------------------------------------===//
//
// Part of the srcnav project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <iostream>

bool runLoggerTests();
bool runMethodTests();
bool runProtocolTests();
bool runMessageTests();
bool runJsonRpcIOTests();
bool runMessageQueueTests();
bool runMessageReaderTests();
bool runLanguageClientTests();
bool runTelemetryTests();
bool runDispatcherTests();
bool runDocumentStoreTests();
bool runOverlayServerTests();
bool runServerConfigTests();
bool runConnectionTests();

int main()
{
    bool ok = true;
    ok      = runLoggerTests() && ok;
    ok      = runMethodTests() && ok;
    ok      = runProtocolTests() && ok;
    ok      = runMessageTests() && ok;
    ok      = runJsonRpcIOTests() && ok;
    ok      = runMessageQueueTests() && ok;
    ok      = runMessageReaderTests() && ok;
    ok      = runLanguageClientTests() && ok;
    ok      = runTelemetryTests() && ok;
    ok      = runDispatcherTests() && ok;
    ok      = runDocumentStoreTests() && ok;
    ok      = runOverlayServerTests() && ok;
    ok      = runServerConfigTests() && ok;
    ok      = runConnectionTests() && ok;
    if (!ok)
    {
        std::cerr << "unit tests failed\n";
        return 1;
    }
    std::cout << "unit tests passed\n";
    return 0;
}
