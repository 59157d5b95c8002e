#include "ExternalFile.h"

juce::Result copyExternalFile(ExternalFileReference& source, const juce::File& destination)
{
    bool copied = false;
    {
        ScopedExternalAccess access(source);
        if (!access.isGranted()) {
            return juce::Result::fail("Access denied to " + source.getDisplayName());
        }

        const auto file = source.getFile();
        if (!file.existsAsFile()) {
            return juce::Result::fail("File not found: " + file.getFullPathName());
        }

        const auto parent = destination.getParentDirectory();
        if (!parent.isDirectory()) {
            const auto created = parent.createDirectory();
            if (created.failed()) {
                return created;
            }
        }

        copied = file.copyFileTo(destination);
    }

    if (!copied) {
        destination.deleteFile();
        return juce::Result::fail("Could not copy " + source.getDisplayName() + " to " +
                                  destination.getFullPathName());
    }
    return juce::Result::ok();
}
