#include "crypto/e2ee_service.hpp"
#include "crypto/encryption.hpp"
#include "core/sanitize.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QtGlobal>

#include <variant>

namespace daybook::crypto {

namespace {

constexpr char kImageKeyContext[] = "dbimage_";

using EncNoteResult = Result<std::optional<EncryptedNote>, RepositoryError>;
using DecNoteResult = Result<std::optional<NotePayload>, RepositoryError>;

const char* habit_type_name(HabitType type) {
    switch (type) {
        case HabitType::Text: return "text";
        case HabitType::Number: return "number";
        case HabitType::Checkbox: return "checkbox";
    }
    return "text";
}

HabitType habit_type_from(const QString& name) {
    if (name == QLatin1String("number")) return HabitType::Number;
    if (name == QLatin1String("checkbox")) return HabitType::Checkbox;
    return HabitType::Text;
}

QJsonValue habit_value_to_json(const HabitValue& value) {
    return std::visit([](const auto& v) -> QJsonValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return QString::fromStdString(v);
        } else {
            return v;
        }
    }, value);
}

HabitValue habit_value_from_json(const QJsonValue& value) {
    if (value.isBool()) return value.toBool();
    if (value.isDouble()) return value.toDouble();
    return value.toString().toStdString();
}

std::vector<uint8_t> as_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

std::string serialize_note_payload(const NotePayload& payload) {
    QJsonObject root;
    root.insert(QStringLiteral("content"), QString::fromStdString(payload.content));
    if (payload.habits && !payload.habits->empty()) {
        QJsonObject habits;
        for (const auto& [id, entry] : *payload.habits) {
            QJsonObject h;
            h.insert(QStringLiteral("name"), QString::fromStdString(entry.name));
            h.insert(QStringLiteral("type"), QString::fromLatin1(habit_type_name(entry.type)));
            h.insert(QStringLiteral("order"), entry.order);
            h.insert(QStringLiteral("value"), habit_value_to_json(entry.value));
            habits.insert(QString::fromStdString(id), h);
        }
        root.insert(QStringLiteral("habits"), habits);
    }
    return QJsonDocument(root).toJson(QJsonDocument::Compact).toStdString();
}

Result<NotePayload, Error> parse_note_payload(const std::string& json) {
    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(json), &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<NotePayload, Error>::err(Error{"Malformed note payload"});
    }
    const auto root = doc.object();
    const auto content = root.value(QStringLiteral("content"));
    if (!content.isString()) {
        return Result<NotePayload, Error>::err(Error{"Note payload has no content"});
    }

    NotePayload payload;
    payload.content = content.toString().toStdString();

    const auto habits = root.value(QStringLiteral("habits"));
    if (habits.isObject() && !habits.toObject().isEmpty()) {
        HabitValues values;
        const auto obj = habits.toObject();
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            const auto h = it.value().toObject();
            values.emplace(it.key().toStdString(), HabitEntry{
                .name = h.value(QStringLiteral("name")).toString().toStdString(),
                .type = habit_type_from(h.value(QStringLiteral("type")).toString()),
                .order = h.value(QStringLiteral("order")).toInt(),
                .value = habit_value_from_json(h.value(QStringLiteral("value")))
            });
        }
        payload.habits = std::move(values);
    }
    return Result<NotePayload, Error>::ok(std::move(payload));
}

E2eeService::E2eeService(std::shared_ptr<const Keyring> keyring)
    : keyring_(std::move(keyring)) {}

std::optional<std::string> E2eeService::resolve_key_id(
    const std::optional<std::string>& key_id) const {
    if (key_id) return key_id;
    return keyring_->active_key_id();
}

EncNoteResult E2eeService::encrypt_note(const NotePayload& payload,
                                        const std::optional<std::string>& key_id) const {
    const auto id = resolve_key_id(key_id);
    if (!id) {
        return EncNoteResult::ok(std::nullopt);
    }
    const auto* key = keyring_->key(*id);
    if (!key) {
        return EncNoteResult::ok(std::nullopt);
    }

    NotePayload clean{sanitize_html(payload.content), payload.habits};
    if (clean.habits && clean.habits->empty()) {
        clean.habits.reset();
    }
    const auto plaintext = as_bytes(serialize_note_payload(clean));

    auto sealed = seal(plaintext, *key);
    if (sealed.is_err()) {
        return EncNoteResult::err(RepositoryError{
            RepositoryErrorKind::EncryptFailed, sealed.unwrap_err().message});
    }
    const auto& box = sealed.unwrap();
    return EncNoteResult::ok(EncryptedNote{
        .ciphertext = to_base64(box.ciphertext),
        .nonce = to_base64(box.nonce),
        .key_id = *id
    });
}

DecNoteResult E2eeService::decrypt_note(const std::string& ciphertext,
                                        const std::string& nonce,
                                        const std::string& key_id) const {
    const auto* key = keyring_->key(key_id);
    if (!key) {
        qWarning() << "CRYPTO: key unavailable for note:" << QString::fromStdString(key_id);
        return DecNoteResult::ok(std::nullopt);
    }

    auto cipher_bytes = from_base64(ciphertext);
    auto nonce_bytes = from_base64(nonce);
    if (cipher_bytes.is_err() || nonce_bytes.is_err()) {
        return DecNoteResult::err(RepositoryError{
            RepositoryErrorKind::DecryptFailed, "Envelope is not valid base64"});
    }

    auto opened = open(cipher_bytes.unwrap(), nonce_bytes.unwrap(), *key);
    if (opened.is_err()) {
        return DecNoteResult::err(RepositoryError{
            RepositoryErrorKind::DecryptFailed, opened.unwrap_err().message});
    }

    const auto& bytes = opened.unwrap();
    auto parsed = parse_note_payload(std::string(bytes.begin(), bytes.end()));
    if (parsed.is_err()) {
        return DecNoteResult::err(RepositoryError{
            RepositoryErrorKind::DecryptFailed, parsed.unwrap_err().message});
    }

    auto payload = std::move(parsed).unwrap();
    payload.content = sanitize_html(payload.content);
    return DecNoteResult::ok(std::move(payload));
}

const SymmetricKey* E2eeService::image_key(const std::string& key_id) {
    auto cached = image_keys_.find(key_id);
    if (cached != image_keys_.end()) {
        return &cached->second;
    }
    const auto* base = keyring_->key(key_id);
    if (!base) {
        return nullptr;
    }
    auto derived = derive_subkey(*base, 1, kImageKeyContext);
    if (derived.is_err()) {
        qWarning() << "CRYPTO: image key derivation failed:"
                   << QString::fromStdString(derived.unwrap_err().message);
        return nullptr;
    }
    auto [it, inserted] = image_keys_.emplace(key_id, derived.unwrap());
    return &it->second;
}

Result<std::optional<EncryptedImage>, RepositoryError> E2eeService::encrypt_image(
    std::span<const uint8_t> bytes,
    const std::string& image_id,
    const std::optional<std::string>& key_id) {
    using R = Result<std::optional<EncryptedImage>, RepositoryError>;
    const auto id = resolve_key_id(key_id);
    if (!id) {
        return R::ok(std::nullopt);
    }
    const auto* key = image_key(*id);
    if (!key) {
        return R::ok(std::nullopt);
    }

    auto sealed = seal(bytes, *key);
    if (sealed.is_err()) {
        return R::err(RepositoryError{
            RepositoryErrorKind::EncryptFailed, sealed.unwrap_err().message});
    }
    const auto& box = sealed.unwrap();
    return R::ok(EncryptedImage{
        .record = ImageRecord{
            .version = 1,
            .id = image_id,
            .key_id = *id,
            .ciphertext = to_base64(box.ciphertext),
            .nonce = to_base64(box.nonce)
        },
        .sha256 = sha256_hex(bytes),
        .size = static_cast<int64_t>(bytes.size()),
        .key_id = *id
    });
}

Result<std::optional<std::vector<uint8_t>>, RepositoryError> E2eeService::decrypt_image(
    const ImageRecord& record) {
    using R = Result<std::optional<std::vector<uint8_t>>, RepositoryError>;
    const auto* key = image_key(record.key_id);
    if (!key) {
        return R::ok(std::nullopt);
    }
    auto cipher_bytes = from_base64(record.ciphertext);
    auto nonce_bytes = from_base64(record.nonce);
    if (cipher_bytes.is_err() || nonce_bytes.is_err()) {
        return R::err(RepositoryError{
            RepositoryErrorKind::DecryptFailed, "Image envelope is not valid base64"});
    }
    auto opened = open(cipher_bytes.unwrap(), nonce_bytes.unwrap(), *key);
    if (opened.is_err()) {
        return R::err(RepositoryError{
            RepositoryErrorKind::DecryptFailed, opened.unwrap_err().message});
    }
    return R::ok(std::move(opened).unwrap());
}

} // namespace daybook::crypto
