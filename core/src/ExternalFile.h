#pragma once

#include <utility>

#include <juce_core/juce_core.h>

// A file chosen by the user outside the app's storage. Access may have
// to be granted by the platform for the duration of a read, so callers
// bracket every read with ScopedExternalAccess.
class ExternalFileReference {
public:
    virtual ~ExternalFileReference() = default;

    [[nodiscard]] virtual juce::File getFile() const = 0;

    // Name shown to the user, normally the original file name.
    [[nodiscard]] virtual juce::String getDisplayName() const { return getFile().getFileName(); }

    virtual bool beginAccess() = 0;
    virtual void endAccess() = 0;
};

// Plain filesystem path; access is always granted.
class LocalFileReference : public ExternalFileReference {
public:
    explicit LocalFileReference(juce::File file) : file_(std::move(file)) {}

    [[nodiscard]] juce::File getFile() const override { return file_; }
    bool beginAccess() override { return file_.existsAsFile(); }
    void endAccess() override {}

private:
    juce::File file_;
};

// Holds access to an external file for the lifetime of the scope.
class ScopedExternalAccess {
public:
    explicit ScopedExternalAccess(ExternalFileReference& reference)
        : reference_(reference), granted_(reference.beginAccess())
    {
    }

    ~ScopedExternalAccess()
    {
        if (granted_) {
            reference_.endAccess();
        }
    }

    [[nodiscard]] bool isGranted() const { return granted_; }

private:
    ExternalFileReference& reference_;
    const bool granted_;

    JUCE_DECLARE_NON_COPYABLE(ScopedExternalAccess)
};

// Copies an external file into `destination`, holding access only
// while copying. A failed copy leaves no partial file behind.
juce::Result copyExternalFile(ExternalFileReference& source, const juce::File& destination);
