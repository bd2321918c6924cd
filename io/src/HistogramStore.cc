/* -- C++ -- */
/**
 *  @file  io/src/HistogramStore.cc
 *
 *  @brief Implementation for the ROOT histogram container.
 */

#include "HistogramStore.hh"

#include <TClass.h>
#include <TDirectory.h>
#include <TFile.h>
#include <TH1.h>
#include <TH2.h>
#include <TH3.h>
#include <TKey.h>
#include <TList.h>
#include <TObjString.h>
#include <TTree.h>

#include <filesystem>
#include <system_error>
#include <utility>

#include "MetadataCodec.hh"
#include "NameCodec.hh"

namespace
{

// TH2 and TH3 inherit TH1 as well; only one-dimensional histograms become records.
bool is_1d_histogram(const TKey &key)
{
    TClass *cls = TClass::GetClass(key.GetClassName());
    if (!cls || !cls->InheritsFrom(TH1::Class()))
    {
        return false;
    }
    return !cls->InheritsFrom(TH2::Class()) && !cls->InheritsFrom(TH3::Class());
}

std::vector<TKey *> keys_of(TDirectory &dir)
{
    std::vector<TKey *> out;
    TIter next(dir.GetListOfKeys());
    while (TObject *obj = next())
    {
        if (auto *key = dynamic_cast<TKey *>(obj))
        {
            out.push_back(key);
        }
    }
    return out;
}

void copy_key(TKey &key, TDirectory &src, TDirectory &dst);

void copy_directory(TDirectory &src, TDirectory &dst)
{
    for (TKey *key : keys_of(src))
    {
        copy_key(*key, src, dst);
    }
}

void copy_key(TKey &key, TDirectory &src, TDirectory &dst)
{
    const std::string name = key.GetName();
    TClass *cls = TClass::GetClass(key.GetClassName());

    if (cls && cls->InheritsFrom(TDirectory::Class()))
    {
        TDirectory *sub_src = src.GetDirectory(name.c_str());
        TDirectory *sub_dst = dst.GetDirectory(name.c_str());
        if (!sub_dst)
        {
            sub_dst = dst.mkdir(name.c_str());
        }
        if (!sub_src || !sub_dst)
        {
            throw histpost::StoreError("HistogramStore: cannot copy directory " + name);
        }
        copy_directory(*sub_src, *sub_dst);
        return;
    }

    if (cls && cls->InheritsFrom(TTree::Class()))
    {
        // Trees keep autosave cycles; only the newest one is copied.
        if (src.GetKey(name.c_str()) != &key)
        {
            return;
        }
        auto *tree = dynamic_cast<TTree *>(key.ReadObj());
        if (!tree)
        {
            throw histpost::StoreError("HistogramStore: cannot read tree " + name);
        }
        dst.cd();
        TTree *copy = tree->CloneTree(-1, "fast");
        if (!copy || copy->Write(name.c_str(), TObject::kOverwrite) <= 0)
        {
            throw histpost::StoreError("HistogramStore: cannot copy tree " + name);
        }
        return;
    }

    std::unique_ptr<TObject> obj(key.ReadObj());
    if (!obj)
    {
        throw histpost::StoreError("HistogramStore: cannot read object " + name);
    }
    if (auto *hist = dynamic_cast<TH1 *>(obj.get()))
    {
        hist->SetDirectory(nullptr);
    }
    if (dst.WriteTObject(obj.get(), name.c_str()) <= 0)
    {
        throw histpost::StoreError("HistogramStore: cannot write object " + name);
    }
}

}

namespace histpost
{

HistogramStore::HistogramStore(std::string path, std::string file_path, Mode mode, std::unique_ptr<TFile> file)
    : m_path(std::move(path)),
      m_file_path(std::move(file_path)),
      m_mode(mode),
      m_file(std::move(file))
{
}

HistogramStore::HistogramStore(HistogramStore &&other) noexcept
    : m_path(std::move(other.m_path)),
      m_file_path(std::move(other.m_file_path)),
      m_mode(other.m_mode),
      m_file(std::move(other.m_file))
{
}

HistogramStore::~HistogramStore()
{
    if (!m_file)
    {
        return;
    }
    m_file->Close();
    m_file.reset();
    if (m_mode == Mode::kWrite)
    {
        std::error_code ec;
        std::filesystem::remove(m_file_path, ec);
    }
}

HistogramStore HistogramStore::open_read(const std::string &path)
{
    if (!std::filesystem::exists(path))
    {
        throw StoreError("HistogramStore: no such file " + path);
    }
    std::unique_ptr<TFile> f(TFile::Open(path.c_str(), "READ"));
    if (!f || f->IsZombie())
    {
        throw StoreError("HistogramStore: cannot open input root file " + path);
    }
    return HistogramStore(path, path, Mode::kRead, std::move(f));
}

HistogramStore HistogramStore::open_write(const std::string &destination)
{
    const std::string tmp = temp_path(destination);
    std::unique_ptr<TFile> f(TFile::Open(tmp.c_str(), "RECREATE"));
    if (!f || f->IsZombie())
    {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw StoreError("HistogramStore: cannot open output root file " + tmp);
    }
    return HistogramStore(destination, tmp, Mode::kWrite, std::move(f));
}

std::string HistogramStore::temp_path(const std::string &destination)
{
    return destination + ".tmp";
}

std::string HistogramStore::scaled_sibling(const std::string &path)
{
    const std::filesystem::path p(path);
    if (p.extension() == ".root")
    {
        std::filesystem::path out = p;
        out.replace_filename(p.stem().string() + "_scaled.root");
        return out.string();
    }
    return path + "_scaled";
}

void HistogramStore::require(Mode mode, const char *what) const
{
    if (!m_file)
    {
        throw StoreError(std::string("HistogramStore::") + what + ": handle is closed for " + m_path);
    }
    if (m_mode != mode)
    {
        throw StoreError(std::string("HistogramStore::") + what + ": wrong handle mode for " + m_path);
    }
}

std::vector<HistogramRecord> HistogramStore::list() const
{
    require(Mode::kRead, "list");

    std::vector<HistogramRecord> out;
    for (TKey *key : keys_of(*m_file))
    {
        if (!is_1d_histogram(*key))
        {
            continue;
        }
        std::unique_ptr<TObject> obj(key->ReadObj());
        if (!dynamic_cast<TH1 *>(obj.get()))
        {
            throw StoreError("HistogramStore: cannot read histogram " + std::string(key->GetName()) +
                             " from " + m_path);
        }
        HistogramRecord record(std::unique_ptr<TH1>(static_cast<TH1 *>(obj.release())));
        record.name = key->GetName();
        if (const auto id = NameCodec::parse_merged_name(record.name))
        {
            record.region = id->region;
            record.process = id->process;
            record.variation = id->variation;
        }
        out.push_back(std::move(record));
    }
    return out;
}

std::vector<std::string> HistogramStore::passthrough_keys() const
{
    require(Mode::kRead, "passthrough_keys");

    std::vector<std::string> out;
    for (TKey *key : keys_of(*m_file))
    {
        if (!is_1d_histogram(*key))
        {
            out.emplace_back(key->GetName());
        }
    }
    return out;
}

std::optional<std::string> HistogramStore::read_metadata_blob() const
{
    require(Mode::kRead, "read_metadata_blob");

    TKey *key = m_file->GetKey(MetadataCodec::kMetadataKey);
    if (!key)
    {
        return std::nullopt;
    }
    std::unique_ptr<TObject> obj(key->ReadObj());
    auto *str = dynamic_cast<TObjString *>(obj.get());
    if (!str)
    {
        throw MetadataParseError(std::string("AGC_metadata in ") + m_path + " is a " +
                                 key->GetClassName() + ", not a TObjString");
    }
    return std::string(str->GetString().Data());
}

std::optional<ScalingMetadata> HistogramStore::read_metadata() const
{
    const auto blob = read_metadata_blob();
    if (!blob)
    {
        return std::nullopt;
    }
    return MetadataCodec::decode(*blob);
}

void HistogramStore::write(const HistogramRecord &record)
{
    require(Mode::kWrite, "write");

    if (!record.has_hist())
    {
        throw StoreError("HistogramStore: record " + record.name + " carries no histogram");
    }
    std::unique_ptr<TH1> hist = record.clone_hist(record.name);
    if (m_file->WriteTObject(hist.get(), record.name.c_str()) <= 0)
    {
        throw StoreError("HistogramStore: failed to write histogram " + record.name + " to " + m_file_path);
    }
}

void HistogramStore::write_metadata(const ScalingMetadata &metadata)
{
    require(Mode::kWrite, "write_metadata");

    TObjString blob(MetadataCodec::encode(metadata).c_str());
    if (m_file->WriteTObject(&blob, MetadataCodec::kMetadataKey, "WriteDelete") <= 0)
    {
        throw StoreError("HistogramStore: failed to write AGC_metadata to " + m_file_path);
    }
}

void HistogramStore::copy_passthrough(const HistogramStore &source)
{
    require(Mode::kWrite, "copy_passthrough");
    source.require(Mode::kRead, "copy_passthrough");

    for (TKey *key : keys_of(*source.m_file))
    {
        if (is_1d_histogram(*key))
        {
            continue;
        }
        copy_key(*key, *source.m_file, *m_file);
    }
}

void HistogramStore::commit()
{
    require(Mode::kWrite, "commit");

    m_file->Close();
    m_file.reset();

    std::error_code ec;
    std::filesystem::rename(m_file_path, m_path, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(m_file_path, ignored);
        throw StoreError("HistogramStore: cannot rename " + m_file_path + " to " + m_path + ": " + ec.message());
    }
}

void HistogramStore::close()
{
    if (!m_file)
    {
        return;
    }
    m_file->Close();
    m_file.reset();
    if (m_mode == Mode::kWrite)
    {
        std::error_code ec;
        std::filesystem::remove(m_file_path, ec);
    }
}

} // namespace histpost
