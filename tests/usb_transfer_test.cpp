#include <stdexcept>

#include "usb_test_fixture.hpp"

class USBTransferTest : public USBFixture {
};

static int ErrorCode(const std::function<void()> &call)
{
    try {
        call();
    } catch (const USBError &e) {
        return e.GetCode();
    }
    return USB1_SUCCESS;
}

TEST_F(USBTransferTest, ResultsAreGuardedUntilCompletion)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    int calls = 0;
    transfer->SetBulk(0x81, 64, [&calls](USBTransfer *) { calls++; });

    EXPECT_EQ(ErrorCode([&] { transfer->GetStatus(); }), USB1_ERROR_INVALID_STATE);
    EXPECT_EQ(ErrorCode([&] { transfer->GetActualLength(); }), USB1_ERROR_INVALID_STATE);

    transfer->Submit();
    EXPECT_TRUE(transfer->IsSubmitted());
    EXPECT_EQ(ErrorCode([&] { transfer->GetStatus(); }), USB1_ERROR_INVALID_STATE);
    EXPECT_EQ(ErrorCode([&] { transfer->GetBuffer(); }), USB1_ERROR_INVALID_STATE);

    ASSERT_TRUE(m_bus->Complete(0x81, USB1_TRANSFER_COMPLETED, { 1, 2, 3 }));
    HandleEventsUntil([&calls] { return calls > 0; });

    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(transfer->IsSubmitted());
    EXPECT_EQ(transfer->GetStatus(), USB1_TRANSFER_COMPLETED);
    EXPECT_EQ(transfer->GetActualLength(), 3u);

    std::vector<uint8_t> buffer = transfer->GetBuffer();
    ASSERT_EQ(buffer.size(), 64u);
    EXPECT_EQ(buffer[0], 1);
    EXPECT_EQ(buffer[2], 3);
}

TEST_F(USBTransferTest, SubmitRequiresConfiguration)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();

    EXPECT_EQ(ErrorCode([&] { transfer->Submit(); }), USB1_ERROR_INVALID_STATE);
}

TEST_F(USBTransferTest, SubmittedTransferCannotBeAltered)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 64);
    transfer->Submit();

    EXPECT_EQ(ErrorCode([&] { transfer->Submit(); }), USB1_ERROR_INVALID_STATE);
    EXPECT_EQ(ErrorCode([&] { transfer->SetBulk(0x81, 32); }), USB1_ERROR_INVALID_STATE);
    EXPECT_EQ(ErrorCode([&] { transfer->SetBuffer(32); }), USB1_ERROR_INVALID_STATE);
    EXPECT_EQ(ErrorCode([&] { transfer->Close(); }), USB1_ERROR_INVALID_STATE);

    transfer->Cancel();
    HandleEventsUntil([&] { return !transfer->IsSubmitted(); });
    EXPECT_EQ(transfer->GetStatus(), USB1_TRANSFER_CANCELLED);
}

TEST_F(USBTransferTest, CancelOfIdleTransferIsNotFound)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x02, std::vector<uint8_t>(8, 0xaa));

    EXPECT_EQ(ErrorCode([&] { transfer->Cancel(); }), USB1_ERROR_NOT_FOUND);
}

TEST_F(USBTransferTest, FailedSubmitLeavesTransferIdle)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 64);
    m_bus->SetSubmitError(USB1_ERROR_NO_DEVICE);

    EXPECT_EQ(ErrorCode([&] { transfer->Submit(); }), USB1_ERROR_NO_DEVICE);
    EXPECT_FALSE(transfer->IsSubmitted());
    EXPECT_EQ(m_context->GetSubmittedTransferCount(), 0u);

    m_bus->SetSubmitError(0);
    transfer->Submit();
    EXPECT_EQ(m_context->GetSubmittedTransferCount(), 1u);
}

TEST_F(USBTransferTest, BulkReadTimesOut)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    bool done = false;
    transfer->SetBulk(0x81, 64, [&done](USBTransfer *) { done = true; }, std::any(), 100);
    transfer->Submit();

    auto start = std::chrono::steady_clock::now();
    HandleEventsUntil([&done] { return done; });

    ASSERT_TRUE(done);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(90));
    EXPECT_EQ(transfer->GetStatus(), USB1_TRANSFER_TIMED_OUT);
    EXPECT_EQ(transfer->GetActualLength(), 0u);
}

TEST_F(USBTransferTest, ControlSetupRoundTrip)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();

    transfer->SetControl(USB1_ENDPOINT_IN | USB1_REQUEST_TYPE_VENDOR | USB1_RECIPIENT_DEVICE, 0x42, 0x1234, 0xabcd,
        static_cast<uint16_t>(16));

    EXPECT_EQ(transfer->GetType(), USB1_TRANSFER_TYPE_CONTROL);
    USBControlSetup setup = transfer->GetControlSetup();
    EXPECT_EQ(setup.requestType, 0xc0);
    EXPECT_EQ(setup.request, 0x42);
    EXPECT_EQ(setup.value, 0x1234);
    EXPECT_EQ(setup.index, 0xabcd);
    EXPECT_EQ(setup.length, 16);
    EXPECT_EQ(transfer->GetBuffer().size(), 16u);

    transfer->SetControl(USB1_REQUEST_TYPE_CLASS | USB1_RECIPIENT_INTERFACE, 0x09, 0x0200, 0,
        std::vector<uint8_t>{ 1, 2, 3 });
    setup = transfer->GetControlSetup();
    EXPECT_EQ(setup.length, 3);
    EXPECT_EQ(transfer->GetBuffer(), (std::vector<uint8_t>{ 1, 2, 3 }));

    EXPECT_EQ(ErrorCode([&] { transfer->SetBuffer(8); }), USB1_ERROR_INVALID_PARAM);
}

TEST_F(USBTransferTest, ControlReadCopiesDataStage)
{
    RespondWith(USB1_TRANSFER_COMPLETED, { 0xde, 0xad });

    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    bool done = false;
    transfer->SetControl(0xc0, 0x01, 0, 0, static_cast<uint16_t>(4), [&done](USBTransfer *) { done = true; });
    transfer->Submit();
    HandleEventsUntil([&done] { return done; });

    EXPECT_EQ(transfer->GetActualLength(), 2u);
    EXPECT_EQ(transfer->GetBuffer(), (std::vector<uint8_t>{ 0xde, 0xad, 0, 0 }));
    EXPECT_EQ(transfer->GetControlSetup().request, 0x01);
}

TEST_F(USBTransferTest, IsochronousPacketLayout)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer(4);

    transfer->SetIsochronous(0x84, 400);
    EXPECT_EQ(transfer->GetISOSetupList(), (std::vector<unsigned int>{ 100, 100, 100, 100 }));

    EXPECT_EQ(ErrorCode([&] { transfer->SetIsochronous(0x84, 401); }), USB1_ERROR_INVALID_PARAM);

    transfer->SetIsochronous(0x84, 200, nullptr, std::any(), 0, { 150, 0, 50 });
    EXPECT_EQ(transfer->GetISOSetupList(), (std::vector<unsigned int>{ 150, 0, 50 }));

    std::vector<std::vector<uint8_t>> buffers = transfer->GetISOBufferList();
    ASSERT_EQ(buffers.size(), 3u);
    EXPECT_EQ(buffers[0].size(), 150u);
    EXPECT_TRUE(buffers[1].empty());

    EXPECT_EQ(ErrorCode([&] {
        transfer->SetIsochronous(0x84, 200, nullptr, std::any(), 0, { 100, 50 });
    }), USB1_ERROR_INVALID_PARAM);
    EXPECT_EQ(ErrorCode([&] {
        transfer->SetIsochronous(0x84, 200, nullptr, std::any(), 0, { 150, 100 });
    }), USB1_ERROR_INVALID_PARAM);
    EXPECT_EQ(ErrorCode([&] {
        transfer->SetIsochronous(0x84, 5, nullptr, std::any(), 0, { 1, 1, 1, 1, 1 });
    }), USB1_ERROR_INVALID_PARAM);
    EXPECT_EQ(ErrorCode([&] { transfer->SetBuffer(10); }), USB1_ERROR_INVALID_PARAM);

    std::unique_ptr<USBTransfer> bulk = m_handle->GetTransfer();
    EXPECT_EQ(ErrorCode([&] { bulk->SetIsochronous(0x84, 100); }), USB1_ERROR_INVALID_PARAM);
    bulk->SetBulk(0x81, 10);
    EXPECT_EQ(ErrorCode([&] { bulk->GetISOSetupList(); }), USB1_ERROR_INVALID_PARAM);
}

TEST_F(USBTransferTest, IsochronousResultsFollowActualLengths)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer(3);
    bool done = false;
    transfer->SetIsochronous(0x84, 300, [&done](USBTransfer *) { done = true; });
    transfer->Submit();

    std::vector<uint8_t> data(150);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i);
    }
    ASSERT_TRUE(m_bus->Complete(0x84, USB1_TRANSFER_COMPLETED, data));
    HandleEventsUntil([&done] { return done; });

    std::vector<USBIsoPacketResult> results = transfer->GetISOResults();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].data.size(), 100u);
    ASSERT_EQ(results[1].data.size(), 50u);
    EXPECT_EQ(results[1].data[0], 100);
    EXPECT_TRUE(results[2].data.empty());
    EXPECT_EQ(results[0].status, USB1_TRANSFER_COMPLETED);
}

TEST_F(USBTransferTest, DoomReleasesIdleTransfer)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 64);
    int live = m_bus->GetLiveTransferCount();

    transfer->Doom();

    EXPECT_TRUE(transfer->IsDoomed());
    EXPECT_EQ(m_bus->GetLiveTransferCount(), live - 1);
    EXPECT_THROW(transfer->Submit(), DoomedTransferError);
    EXPECT_THROW(transfer->GetStatus(), DoomedTransferError);
    EXPECT_THROW(transfer->SetBulk(0x81, 64), DoomedTransferError);
    EXPECT_THROW(transfer->Cancel(), DoomedTransferError);

    transfer->Doom();
    EXPECT_EQ(m_bus->GetLiveTransferCount(), live - 1);
}

TEST_F(USBTransferTest, DoomInFlightDeliversFinalCompletion)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    int calls = 0;
    int statusInCallback = -1;
    transfer->SetBulk(0x81, 64, [&](USBTransfer *t) {
        calls++;
        statusInCallback = t->GetStatus();
    });
    transfer->Submit();
    int live = m_bus->GetLiveTransferCount();

    transfer->Doom();
    EXPECT_EQ(m_bus->GetLiveTransferCount(), live);

    ASSERT_TRUE(m_bus->Complete(0x81, USB1_TRANSFER_COMPLETED, { 7 }));
    HandleEventsUntil([&calls] { return calls > 0; });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(statusInCallback, USB1_TRANSFER_COMPLETED);
    EXPECT_EQ(m_bus->GetLiveTransferCount(), live - 1);
    EXPECT_THROW(transfer->GetStatus(), DoomedTransferError);
    EXPECT_THROW(transfer->Submit(), DoomedTransferError);
}

TEST_F(USBTransferTest, HelperResubmitsWhileCallbackAsks)
{
    RespondWith(USB1_TRANSFER_COMPLETED, { 1, 2, 3, 4 });

    int completions = 0;
    USBTransferHelper helper;
    helper.SetEventCallback(USB1_TRANSFER_COMPLETED, [&completions](USBTransfer *) {
        return ++completions < 3;
    });

    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 8, helper);
    transfer->Submit();
    HandleEventsUntil([&completions] { return completions >= 3; });

    EXPECT_EQ(completions, 3);
    EXPECT_FALSE(transfer->IsSubmitted());
    EXPECT_TRUE(helper.GetEventCallback(USB1_TRANSFER_COMPLETED) != nullptr);
    EXPECT_TRUE(helper.GetEventCallback(USB1_TRANSFER_STALL) == nullptr);
    EXPECT_EQ(ErrorCode([&] { helper.SetEventCallback(42, nullptr); }), USB1_ERROR_INVALID_PARAM);
}

TEST_F(USBTransferTest, HelperFallsBackToDefaultCallback)
{
    RespondWith(USB1_TRANSFER_STALL);

    int defaults = 0;
    USBTransferHelper helper;
    helper.SetEventCallback(USB1_TRANSFER_COMPLETED, [](USBTransfer *) { return false; });
    helper.SetDefaultCallback([&defaults](USBTransfer *) {
        defaults++;
        return false;
    });

    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 8, helper);
    transfer->Submit();
    HandleEventsUntil([&defaults] { return defaults > 0; });

    EXPECT_EQ(defaults, 1);
    EXPECT_EQ(transfer->GetStatus(), USB1_TRANSFER_STALL);
}

TEST_F(USBTransferTest, CallbackExceptionReachesEventLoop)
{
    RespondWith(USB1_TRANSFER_COMPLETED);

    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x02, std::vector<uint8_t>(4, 0), [](USBTransfer *) {
        throw std::runtime_error("callback failed");
    });
    transfer->Submit();

    EXPECT_THROW(m_context->HandleEventsTimeout(std::chrono::seconds(1)), std::runtime_error);
    EXPECT_FALSE(transfer->IsSubmitted());
    EXPECT_EQ(transfer->GetActualLength(), 4u);

    // The next call is not affected
    m_context->HandleEventsTimeout(std::chrono::milliseconds(0));
}

TEST_F(USBTransferTest, DestroyingInFlightTransferCancelsIt)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    transfer->SetBulk(0x81, 64);
    transfer->Submit();
    int live = m_bus->GetLiveTransferCount();

    transfer.reset();

    EXPECT_EQ(m_bus->GetLiveTransferCount(), live);
    HandleEventsUntil([this] { return m_context->GetSubmittedTransferCount() == 0; });
    EXPECT_EQ(m_bus->GetLiveTransferCount(), live - 1);
}

TEST_F(USBTransferTest, CallbackMayDestroyItsTransfer)
{
    RespondWith(USB1_TRANSFER_COMPLETED);

    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer();
    bool done = false;
    transfer->SetBulk(0x81, 4, [&](USBTransfer *) {
        transfer.reset();
        done = true;
    });
    transfer->Submit();
    HandleEventsUntil([&done] { return done; });

    EXPECT_TRUE(done);
    EXPECT_TRUE(transfer == nullptr);
    EXPECT_EQ(m_bus->GetLiveTransferCount(), 0);
}

TEST_F(USBTransferTest, UserDataAndFlags)
{
    std::unique_ptr<USBTransfer> transfer = m_handle->GetTransfer(0, true, false);
    EXPECT_TRUE(transfer->IsShortAnError());
    EXPECT_FALSE(transfer->IsZeroPacketAdded());

    transfer->SetBulk(0x02, std::vector<uint8_t>(512, 0), nullptr, std::string("payload"));
    EXPECT_EQ(std::any_cast<std::string>(transfer->GetUserData()), "payload");

    transfer->SetAddZeroPacket(true);
    transfer->SetShortIsError(false);
    EXPECT_TRUE(transfer->IsZeroPacketAdded());
    EXPECT_FALSE(transfer->IsShortAnError());

    transfer->SetUserData(5);
    EXPECT_EQ(std::any_cast<int>(transfer->GetUserData()), 5);

    transfer->Close();
    EXPECT_TRUE(transfer->IsDoomed());
    EXPECT_FALSE(transfer->GetUserData().has_value());
    EXPECT_THROW(transfer->SetUserData(6), DoomedTransferError);
}
