#include <iostream>

#include <pugixml.hpp>

#include <nli/zip_reader.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <image.zip>\n";
    return 1;
  }

  std::string error;
  auto reader = nli::ZipReader::open(argv[1], &error);

  if (!reader) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << "Image: " << argv[1] << "\n";
  std::cout << "Members: " << reader->entryCount() << "\n\n";

  for (const auto &member : reader->entries()) {
    std::cout << "  " << member.path << " (" << member.uncompressedSize << " bytes)\n";
  }

  auto manifest = reader->extractText("._metadata/image_contents.xml", &error);
  if (!manifest) {
    std::cerr << "No manifest: " << error << "\n";
    return 1;
  }

  pugi::xml_document doc;
  if (!doc.load_string(manifest->c_str())) {
    std::cerr << "Manifest is not valid XML\n";
    return 1;
  }

  std::cout << "\nDocuments:\n";
  for (pugi::xml_node document :
       doc.child("Root").child("Batch").child("Documents").children("Document")) {
    std::cout << "  " << document.attribute("DocID").value() << " ("
              << document.attribute("MimeType").value() << ")\n";
  }

  return 0;
}
