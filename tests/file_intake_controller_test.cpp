#include "test_base.hpp"
#include "core/file_intake_controller.hpp"
#include "core/intake_event_source.hpp"

class FileIntakeControllerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        options_.policy.accept = "image/*";
        options_.policy.size.max = 1000;

        callbacks_.on_drop = [this](const std::vector<FileDescriptor> &files,
                                    const std::vector<FileDescriptor> &accepted,
                                    const std::vector<FileDescriptor> &rejected,
                                    const std::vector<ValidationError> &errors)
        {
            ++drop_calls_;
            last_files_ = files;
            last_accepted_ = accepted;
            last_rejected_ = rejected;
            last_errors_ = errors;
        };
        callbacks_.on_drop_accepted = [this](const std::vector<FileDescriptor> &)
        { ++accepted_calls_; };
        callbacks_.on_drop_rejected = [this](const std::vector<FileDescriptor> &)
        { ++rejected_calls_; };
        callbacks_.on_drag_enter = [this]()
        { ++enter_calls_; };
        callbacks_.on_drag_over = [this]()
        { ++over_calls_; };
        callbacks_.on_drag_leave = [this]()
        { ++leave_calls_; };
    }

    std::vector<FileDescriptor> mixedBatch() const
    {
        return {makeFile("a.png", "image/png", 100), makeFile("b.txt", "text/plain", 100)};
    }

    DirectEventSource source_;
    IntakeOptions options_;
    IntakeCallbacks callbacks_;

    int drop_calls_ = 0;
    int accepted_calls_ = 0;
    int rejected_calls_ = 0;
    int enter_calls_ = 0;
    int over_calls_ = 0;
    int leave_calls_ = 0;
    std::vector<FileDescriptor> last_files_;
    std::vector<FileDescriptor> last_accepted_;
    std::vector<FileDescriptor> last_rejected_;
    std::vector<ValidationError> last_errors_;
};

TEST_F(FileIntakeControllerTest, DropReportsPartition)
{
    FileIntakeController controller(source_, options_, callbacks_);
    source_.emit({IntakeEventType::DROP, mixedBatch()});

    EXPECT_EQ(drop_calls_, 1);
    EXPECT_EQ(last_files_.size(), 2u);
    ASSERT_EQ(last_accepted_.size(), 1u);
    EXPECT_EQ(last_accepted_[0].name(), "a.png");
    ASSERT_EQ(last_errors_.size(), 1u);
    EXPECT_EQ(last_errors_[0].kind, ValidationErrorKind::TYPE_REJECTED);
    EXPECT_EQ(accepted_calls_, 1);
    EXPECT_EQ(rejected_calls_, 1);
}

TEST_F(FileIntakeControllerTest, SubsetCallbacksOnlyWhenNonEmpty)
{
    FileIntakeController controller(source_, options_, callbacks_);

    source_.emit({IntakeEventType::DROP, {makeFile("a.png", "image/png", 1)}});
    EXPECT_EQ(accepted_calls_, 1);
    EXPECT_EQ(rejected_calls_, 0);

    source_.emit({IntakeEventType::FILES_SELECTED, {makeFile("b.txt", "text/plain", 1)}});
    EXPECT_EQ(accepted_calls_, 1);
    EXPECT_EQ(rejected_calls_, 1);
    EXPECT_EQ(drop_calls_, 2);
}

TEST_F(FileIntakeControllerTest, DragEnterFlagsBatchesThatWouldBeRejected)
{
    FileIntakeController controller(source_, options_, callbacks_);

    source_.emit({IntakeEventType::DRAG_ENTER, {makeFile("a.png", "image/png", 1)}});
    EXPECT_TRUE(controller.isDragActive());
    EXPECT_FALSE(controller.hasDragError());

    source_.emit({IntakeEventType::DRAG_ENTER, mixedBatch()});
    EXPECT_TRUE(controller.hasDragError());

    source_.emit({IntakeEventType::DRAG_OVER, {}});
    EXPECT_TRUE(controller.hasDragError());

    source_.emit({IntakeEventType::DRAG_LEAVE, {}});
    EXPECT_FALSE(controller.hasDragError());
    EXPECT_FALSE(controller.isDragActive());

    EXPECT_EQ(enter_calls_, 2);
    EXPECT_EQ(over_calls_, 1);
    EXPECT_EQ(leave_calls_, 1);
    EXPECT_EQ(drop_calls_, 0);
}

TEST_F(FileIntakeControllerTest, DropClearsDragError)
{
    FileIntakeController controller(source_, options_, callbacks_);
    source_.emit({IntakeEventType::DRAG_ENTER, mixedBatch()});
    ASSERT_TRUE(controller.hasDragError());

    source_.emit({IntakeEventType::DROP, mixedBatch()});
    EXPECT_FALSE(controller.hasDragError());
    EXPECT_FALSE(controller.isDragActive());
}

TEST_F(FileIntakeControllerTest, DisabledControllerIgnoresEvents)
{
    options_.disabled = true;
    FileIntakeController controller(source_, options_, callbacks_);

    source_.emit({IntakeEventType::DRAG_ENTER, mixedBatch()});
    source_.emit({IntakeEventType::DROP, mixedBatch()});
    EXPECT_FALSE(controller.hasDragError());
    EXPECT_EQ(enter_calls_, 0);
    EXPECT_EQ(drop_calls_, 0);

    ValidationResult result = controller.handleFiles(mixedBatch());
    EXPECT_TRUE(result.accepted.empty());
    EXPECT_TRUE(result.rejected.empty());

    IntakeOptions enabled = options_;
    enabled.disabled = false;
    controller.setOptions(enabled);
    source_.emit({IntakeEventType::DROP, mixedBatch()});
    EXPECT_EQ(drop_calls_, 1);
}

TEST_F(FileIntakeControllerTest, SingleFilePolicy)
{
    options_.policy.allow_multiple = false;
    FileIntakeController controller(source_, options_, callbacks_);

    ValidationResult result = controller.handleFiles({makeFile("a.png", "image/png", 1),
                                                      makeFile("b.png", "image/png", 1)});
    EXPECT_EQ(result.accepted.size(), 1u);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ValidationErrorKind::MULTIPLE_NOT_ALLOWED);
}

TEST_F(FileIntakeControllerTest, UnsubscribesOnDestruction)
{
    {
        FileIntakeController controller(source_, options_, callbacks_);
        EXPECT_EQ(source_.listenerCount(), 1u);
    }
    EXPECT_EQ(source_.listenerCount(), 0u);
    source_.emit({IntakeEventType::DROP, mixedBatch()});
    EXPECT_EQ(drop_calls_, 0);
}

TEST_F(FileIntakeControllerTest, MissingCallbacksAreTolerated)
{
    FileIntakeController controller(source_, options_, IntakeCallbacks());
    source_.emit({IntakeEventType::DRAG_ENTER, mixedBatch()});
    source_.emit({IntakeEventType::DRAG_OVER, {}});
    source_.emit({IntakeEventType::DRAG_LEAVE, {}});
    ValidationResult result = controller.handleFiles(mixedBatch());
    EXPECT_EQ(result.accepted.size(), 1u);
}
