#pragma once

#include <string>
#include "sardauscan/scan_data.hpp"

namespace sardauscan {

class ScanDataFormat {
    public:
        virtual ~ScanDataFormat() = default;
        virtual std::string format_name() const = 0;
        virtual std::string extension() const = 0;
        // "<format name> (*<ext>)|*<ext>"
        std::string dialog_filter() const;
};

class ScanDataWriter : public virtual ScanDataFormat {
    public:
        // Throws std::runtime_error if the file cannot be written or the data does not fit the format
        virtual void write(const std::string& filename, const ScanData& data) const = 0;
};

class ScanDataReader : public virtual ScanDataFormat {
    public:
        virtual ScanDataPtr read(const std::string& filename) const = 0;
};

// ------- DEFINED FORMATS -------

// Native scan file (JSON), keeps lines, normals, colours and faces
class ScanDataIO : public ScanDataWriter, public ScanDataReader {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        void write(const std::string& filename, const ScanData& data) const override;
        ScanDataPtr read(const std::string& filename) const override;
};

class StlIO : public ScanDataWriter {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        void write(const std::string& filename, const ScanData& data) const override;
};

class PlyIO : public ScanDataWriter {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        void write(const std::string& filename, const ScanData& data) const override;
};

class XyzIO : public ScanDataWriter {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        void write(const std::string& filename, const ScanData& data) const override;
};

class WaveFormIO : public ScanDataWriter {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        void write(const std::string& filename, const ScanData& data) const override;
};

class PcdIO : public ScanDataReader {
    public:
        std::string format_name() const override;
        std::string extension() const override;
        ScanDataPtr read(const std::string& filename) const override;
};

}  // namespace sardauscan
